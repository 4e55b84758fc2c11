//  octet.hpp -- type and trait definitions
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

#ifndef ptouch_octet_hpp_
#define ptouch_octet_hpp_

#include <cstdint>
#include <ios>
#include <string>

namespace ptouch {

using std::int8_t;
using std::int16_t;
using std::int32_t;
using std::uint8_t;
using std::uint16_t;
using std::uint32_t;

//! A set of eight bits with no particular interpretation attached
/*! Everything that travels over a connexion, command bytes, raster
 *  data and status replies alike, is a sequence of octets.
 *
 *  \sa  http://en.wikipedia.org/wiki/Octet_(computing)
 */
typedef char octet;

//! Character traits for octet sequences
/*! Plain \c char may be signed.  Protocol code that compares octets
 *  against constants above 0x7f should go through to_int_type().
 */
struct traits
  : std::char_traits< octet >
{
  //! Convert \a c to its equivalent, non-negative integer value
  /*! \note This is meant to work with both signed and unsigned octet
   *        types.
   */
  static int_type to_int_type (const char_type& c);
};

//! Signed integral type that can be used to count octets
using std::streamsize;

} // namespace ptouch

#endif /* ptouch_octet_hpp_ */
