//  compression.hpp -- run-length coding of raster lines
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

#ifndef drivers_brother_compression_hpp_
#define drivers_brother_compression_hpp_

#include "buffer.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Compresses \a data using the TIFF PackBits scheme
/*! Runs of two or more identical bytes, up to 128 at a time, become a
 *  count byte of \c 1-n followed by the repeated byte.  Everything
 *  else is copied in literal blocks of at most 128 bytes, each headed
 *  by a count byte of \c n-1.
 */
byte_buffer pack_bits (const byte_buffer& data);

//! Undoes what pack_bits() did
/*! Throws a decode_error when \a data ends in the middle of a block.
 *  A count byte of \c -128 is skipped, as the TIFF specification
 *  recommends.
 */
byte_buffer unpack_bits (const byte_buffer& data);

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_compression_hpp_ */
