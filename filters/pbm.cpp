//  pbm.cpp -- read raw portable bitmap images
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

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/throw_exception.hpp>

#include "ptouch/log.hpp"

#include "pbm.hpp"

namespace ptouch {
namespace _flt_ {

const streamsize pbm::max_size;

using std::runtime_error;

namespace {

void
skip_space_(std::istream& is)
{
  while (is)
    {
      int c = is.peek ();
      if ('#' == c)
        is.ignore (std::numeric_limits< std::streamsize >::max (), '\n');
      else if (std::istream::traits_type::eof () != c && std::isspace (c))
        is.get ();
      else
        break;
    }
}

streamsize
read_size_(std::istream& is, const char *what)
{
  skip_space_(is);

  streamsize value = 0;
  if (!(is >> value) || 0 >= value || pbm::max_size < value)
    BOOST_THROW_EXCEPTION
      (runtime_error ((format ("PBM: invalid image %1%") % what).str ()));
  return value;
}

}       // namespace

pbm
pbm::read (std::istream& is)
{
  std::string magic (2, '\0');
  if (!is.read (&magic[0], magic.size ()) || "P4" != magic)
    BOOST_THROW_EXCEPTION (runtime_error ("PBM: not a raw portable bitmap"));

  streamsize w = read_size_(is, "width");
  streamsize h = read_size_(is, "height");

  if (h > std::numeric_limits< streamsize >::max () / w)
    BOOST_THROW_EXCEPTION (runtime_error ("PBM: invalid image size"));

  // exactly one whitespace character separates header and raster
  int c = is.get ();
  if (!std::isspace (c))
    BOOST_THROW_EXCEPTION (runtime_error ("PBM: malformed header"));

  pbm rv (w, h);

  const streamsize row_bytes = (w + 7) / 8;
  std::string row (row_bytes, '\0');
  for (streamsize y = 0; y < h; ++y)
    {
      if (!is.read (&row[0], row_bytes))
        BOOST_THROW_EXCEPTION
          (runtime_error ((format ("PBM: image data ends at row %1% of %2%")
                           % y % h).str ()));

      for (streamsize x = 0; x < w; ++x)
        {
          int bits = traits::to_int_type (row[x / 8]);
          rv.pixel (x, y, bits & (0x80 >> (x % 8)));
        }
    }

  log::trace ("PBM: read %1%x%2% image") % w % h;
  return rv;
}

pbm::pbm (streamsize width, streamsize height)
  : width_(width), height_(height), pixels_(width * height, false)
{}

bool
pbm::pixel (streamsize x, streamsize y) const
{
  return pixels_[y * width_ + x];
}

void
pbm::pixel (streamsize x, streamsize y, bool black)
{
  pixels_[y * width_ + x] = black;
}

std::vector< bool >
pbm::column (streamsize x) const
{
  std::vector< bool > rv;
  rv.reserve (height_);
  for (streamsize y = 0; y < height_; ++y)
    rv.push_back (pixel (x, y));
  return rv;
}

}       // namespace _flt_
}       // namespace ptouch
