//  media.hpp -- tape and label media loaded in a printer
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

#ifndef drivers_brother_media_hpp_
#define drivers_brother_media_hpp_

#include <ostream>
#include <string>

#include <boost/optional.hpp>

#include "code-point.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Media as reported by, or expected of, a printer
/*! Media are plain values.  A fresh one is decoded from every status
 *  reply and the caller may construct one to describe what a job
 *  expects to print on.
 *
 *  Widths and lengths are in whole millimetres, as the printers report
 *  them.  A length of zero means continuous media.
 */
class media
{
public:
  enum kind_type {
    UNKNOWN,
    NO_MEDIA,
    LAMINATED_TAPE,
    NON_LAMINATED_TAPE,
    HEAT_SHRINK_TUBE,
    CONTINUOUS_TAPE,
    DIE_CUT_LABEL,
    INCOMPATIBLE,
  };

  //! Printable part of the print head for a given media, in pins
  struct area
  {
    uint16_t margin;            //!< unused pins before the first dot
    uint16_t printable;         //!< pins that land on the media

    area (uint16_t m = 0, uint16_t p = 0)
      : margin (m), printable (p)
    {}

    bool operator== (const area& that) const
    {
      return margin == that.margin && printable == that.printable;
    }
  };

  media (kind_type kind = UNKNOWN, uint16_t width_mm = 0,
         uint16_t length_mm = 0);

  //! Interprets the media bytes of a status reply
  /*! Unknown \a kind identifiers map to UNKNOWN rather than fail so
   *  that new media types do not break printing.
   */
  static media from_status (byte kind, byte width, byte length);

  kind_type kind () const { return kind_; }
  uint16_t width_mm () const { return width_; }
  uint16_t length_mm () const { return length_; }

  //! Media type byte as used in the print information command
  byte kind_code () const;

  //! Whether this media can take a job that expects \a hint
  /*! A \a hint width of zero and a kind of UNKNOWN act as wildcards.
   *  Any other difference in width or kind is incompatible, as is a
   *  length difference for die-cut labels when the \a hint names a
   *  length.  Without a \a hint everything is compatible.
   */
  bool is_compatible (const boost::optional< media >& hint) const;

  //! Print head area that covers this media
  /*! Returns nothing for media widths not in the table.
   */
  boost::optional< area > print_area () const;

  bool operator== (const media& that) const;
  bool operator!= (const media& that) const { return !(*this == that); }

  static const char * name (kind_type kind);

  std::string str () const;

private:
  kind_type kind_;
  uint16_t  width_;
  uint16_t  length_;
};

std::ostream& operator<< (std::ostream& os, const media& m);

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_media_hpp_ */
