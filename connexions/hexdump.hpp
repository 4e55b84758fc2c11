//  hexdump.hpp -- log connexion transmissions
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

#ifndef connexions_hexdump_hpp_
#define connexions_hexdump_hpp_

#include <string>
#include <vector>

#include "ptouch/connexion.hpp"

namespace ptouch {
namespace _cnx_ {

//! Logs everything that goes across a connexion
/*! Each transmission is rendered in the canonical hex+ASCII layout,
 *  sixteen octets per line, and logged at log::DEBUG level.  Outgoing
 *  data is marked with \c >>, incoming data with \c <<.
 *
 *  Creating a hexdump raises the log::threshold to log::DEBUG.
 *  Lowering it again afterwards silences the dump.
 */
class hexdump
  : public decorator< connexion >
{
public:
  hexdump (connexion::ptr instance);

  virtual void send (const octet *message, streamsize size);
  virtual void send (const octet *message, streamsize size, double timeout);
  virtual streamsize recv (octet *message, streamsize size);
  virtual streamsize recv (octet *message, streamsize size, double timeout);

  static std::vector< std::string >
  format_lines (const octet *buf, streamsize size, const std::string& io);

protected:
  void hexdump_(const octet *message, streamsize size,
                const std::string& io);
};

} // namespace _cnx_
} // namespace ptouch

#endif  /* connexions_hexdump_hpp_ */
