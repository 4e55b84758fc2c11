//  buffer.hpp -- octet containers for protocol messages
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

#ifndef drivers_brother_buffer_hpp_
#define drivers_brother_buffer_hpp_

#include <ostream>
#include <string>

#include "code-point.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

template< typename T >
class basic_buffer
  : private std::basic_string< T >
{
  typedef std::basic_string< T > base;
public:
  using typename base::const_iterator;
  using typename base::iterator;
  using typename base::const_reference;
  using typename base::reference;
  using typename base::size_type;
  using typename base::value_type;

  basic_buffer ()
    : base ()
  {}

  basic_buffer (size_type sz, T value)
    : base (sz, value)
  {}

  basic_buffer (const T *buf, size_type sz)
    : base (buf, sz)
  {}

  template< typename InputIterator >
  basic_buffer (InputIterator first, InputIterator last)
    : base (first, last)
  {}

  bool
  operator== (const basic_buffer& that) const
  {
    return static_cast< const base& > (*this)
      ==   static_cast< const base& > (that);
  }

  bool
  operator!= (const basic_buffer& that) const
  {
    return !(*this == that);
  }

  basic_buffer&
  operator+= (const basic_buffer& that)
  {
    base::append (that);
    return *this;
  }

  using base::begin;
  using base::end;
  using base::reserve;
  using base::resize;
  using base::clear;
  using base::push_back;
  using base::assign;
  using base::append;
  using base::size;
  using base::empty;
  using base::operator[];

  const T * data () const
  {
    return base::data ();
  }

  std::ostream& operator>> (std::ostream& os) const
  {
    return os << static_cast< const base& > (*this);
  }
};

template< typename T >
std::ostream&
operator<< (std::ostream& os, const basic_buffer< T >& buf)
{
  return buf >> os;
}

typedef basic_buffer< byte > byte_buffer;

//! One raster line worth of pin data, MSB first
typedef byte_buffer raster_line;

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_buffer_hpp_ */
