//  bitmap.cpp -- assemble raster lines from pixel rows
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <boost/throw_exception.hpp>

#include "ptouch/log.hpp"

#include "bitmap.hpp"
#include "exception.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

bitmap::bitmap (uint16_t offset, uint16_t width, uint16_t line_bytes)
  : offset_(offset)
  , width_(width)
  , line_bytes_(line_bytes)
{
  if (8 * line_bytes_ < offset_ + width_)
    BOOST_THROW_EXCEPTION
      (invalid_argument
       ((format ("%1% pixels at offset %2% do not fit %3% pins")
         % width_ % offset_ % (8 * line_bytes_)).str ()));
}

bitmap::bitmap (const media::area& a, uint16_t line_bytes)
  : bitmap (a.margin, a.printable, line_bytes)
{}

void
bitmap::add_line (const std::vector< bool >& pixels)
{
  if (width_ < pixels.size ())
    BOOST_THROW_EXCEPTION
      (invalid_argument
       ((format ("line of %1% pixels exceeds printable width of %2%")
         % pixels.size () % width_).str ()));

  raster_line line (line_bytes_, NUL);

  for (size_t i = 0; i < pixels.size (); ++i)
    {
      if (!pixels[i]) continue;

      size_t pin = offset_ + i;
      line[pin / 8] |= 1 << (7 - pin % 8);
    }

  lines_.push_back (line);
}

void
bitmap::add_blank_line ()
{
  lines_.push_back (raster_line (line_bytes_, NUL));
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
