//  code-point.hpp -- named bytes of the P-touch raster protocol
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

#ifndef drivers_brother_code_point_hpp_
#define drivers_brother_code_point_hpp_

#include "ptouch/octet.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Bit patterns in groups of eight.
/*! The raster command reference talks about bytes throughout.  The
 *  driver implementation uses the same name.
 */
typedef ptouch::octet byte;

//! Documented code points of the P-touch raster protocol.
/*! Constants for the command introducers and the single byte command
 *  names.  Multi-byte commands are built from these in command.cpp.
 *
 *  \note All constants are imported into the brother namespace.
 */
namespace code_point {

  const byte NUL = 0x00;        //!< null, used for invalidate
  const byte FF  = 0x0c;        //!< form feed, print without feeding
  const byte SUB = 0x1a;        //!< substitute, print with feeding
  const byte ESC = 0x1b;        //!< escape

  const byte EXCLAM  = 0x21;    //!< status notification mode
  const byte AT_MARK = 0x40;    //!< initialize
  const byte UPPER_A = 0x41;    //!< cut every N labels
  const byte UPPER_G = 0x47;    //!< raster graphics transfer
  const byte UPPER_K = 0x4b;    //!< advanced mode settings
  const byte UPPER_M = 0x4d;    //!< various mode settings, compression
  const byte UPPER_S = 0x53;    //!< status information request
  const byte UPPER_Z = 0x5a;    //!< zero raster graphics
  const byte LOWER_A = 0x61;    //!< switch dynamic command mode
  const byte LOWER_D = 0x64;    //!< margin amount
  const byte LOWER_I = 0x69;    //!< extended command introducer
  const byte LOWER_Z = 0x7a;    //!< print information

}       // namespace code_point

using namespace code_point;

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_code_point_hpp_ */
