//  compression.cpp -- run-length coding of raster lines
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

#include "compression.hpp"
#include "exception.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

namespace {

  const byte_buffer::size_type max_block = 128;

}       // namespace

byte_buffer
pack_bits (const byte_buffer& data)
{
  const byte_buffer::size_type n = data.size ();
  byte_buffer rv;
  rv.reserve (n + n / max_block + 1);

  byte_buffer::size_type i = 0;
  while (i < n)
    {
      byte_buffer::size_type run = 1;
      while (i + run < n && run < max_block && data[i + run] == data[i])
        ++run;

      if (2 <= run)
        {
          rv.push_back (static_cast< byte > (1 - static_cast< int > (run)));
          rv.push_back (data[i]);
          i += run;
          continue;
        }

      byte_buffer::size_type start = i;
      while (i < n && i - start < max_block
             && !(i + 1 < n && data[i] == data[i + 1]))
        ++i;

      rv.push_back (static_cast< byte > (i - start - 1));
      rv.append (data.begin () + start, data.begin () + i);
    }
  return rv;
}

byte_buffer
unpack_bits (const byte_buffer& data)
{
  const byte_buffer::size_type n = data.size ();
  byte_buffer rv;

  byte_buffer::size_type i = 0;
  while (i < n)
    {
      int count = static_cast< int8_t > (data[i++]);

      if (-128 == count) continue;

      if (0 <= count)
        {
          byte_buffer::size_type len = count + 1;
          if (n < i + len)
            BOOST_THROW_EXCEPTION
              (decode_error (decode_error::BAD_LENGTH,
                             "truncated literal block"));
          rv.append (data.begin () + i, data.begin () + i + len);
          i += len;
        }
      else
        {
          if (n <= i)
            BOOST_THROW_EXCEPTION
              (decode_error (decode_error::BAD_LENGTH,
                             "truncated repeat block"));
          rv.append (1 - count, data[i]);
          ++i;
        }
    }
  return rv;
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
