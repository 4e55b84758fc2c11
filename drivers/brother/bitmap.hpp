//  bitmap.hpp -- assemble raster lines from pixel rows
//  Copyright (C) 2026  ptouch developers
//
//  License: GPL-3.0+
//
//  This file is part of the 'ptouch' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef drivers_brother_bitmap_hpp_
#define drivers_brother_bitmap_hpp_

#include <vector>

#include "buffer.hpp"
#include "media.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Packs rendered pixels into raster lines for the print head
/*! Each call to add_line() takes one column of the label, i.e. the
 *  pixels that go across the tape, and turns it into a raster line of
 *  line_bytes bytes.  Pixel zero lands on pin \a offset.  Pins map to
 *  bits most significant bit first.
 */
class bitmap
{
public:
  bitmap (uint16_t offset, uint16_t width, uint16_t line_bytes = 16);

  //! Covers the printable area of the media \a a
  explicit bitmap (const media::area& a, uint16_t line_bytes = 16);

  //! Adds a line of \a pixels, \c true meaning black
  /*! Throws an invalid_argument when there are more pixels than fit
   *  in the printable width.
   */
  void add_line (const std::vector< bool >& pixels);

  //! Adds a line without any black pixels
  void add_blank_line ();

  const std::vector< raster_line >& lines () const { return lines_; }

  uint16_t offset () const { return offset_; }
  uint16_t width () const { return width_; }

private:
  uint16_t offset_;
  uint16_t width_;
  uint16_t line_bytes_;

  std::vector< raster_line > lines_;
};

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_bitmap_hpp_ */
