//  pbm.hpp -- read raw portable bitmap images
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

#ifndef filters_pbm_hpp_
#define filters_pbm_hpp_

#include <istream>
#include <vector>

#include "ptouch/octet.hpp"

namespace ptouch {
namespace _flt_ {

//! A bi-level image as found in a raw (P4) portable bitmap
/*! Pixels are \c true for black.  The image is stored row by row, the
 *  way the file lays it out.
 *
 *  \sa http://netpbm.sourceforge.net/doc/pbm.html
 */
class pbm
{
public:
  //! Largest width or height that read() accepts
  static const streamsize max_size = 0xffff;

  //! Reads a P4 image from \a is
  /*! Throws a std::runtime_error when the stream does not hold a P4
   *  image, its size exceeds max_size in either direction or the
   *  stream ends before all of its pixels have been read.
   */
  static pbm read (std::istream& is);

  pbm (streamsize width, streamsize height);

  streamsize width () const { return width_; }
  streamsize height () const { return height_; }

  bool pixel (streamsize x, streamsize y) const;
  void pixel (streamsize x, streamsize y, bool black);

  //! Returns column \a x, top to bottom
  std::vector< bool > column (streamsize x) const;

private:
  streamsize width_;
  streamsize height_;
  std::vector< bool > pixels_;
};

}       // namespace _flt_
}       // namespace ptouch

#endif  /* filters_pbm_hpp_ */
