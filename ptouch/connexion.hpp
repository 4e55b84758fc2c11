//  connexion.hpp -- transport a byte stream to and from a device
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

#ifndef ptouch_connexion_hpp_
#define ptouch_connexion_hpp_

#include <string>

#include "memory.hpp"
#include "octet.hpp"

#include "pattern/decorator.hpp"

namespace ptouch {

//! An opaque, bidirectional byte pipe to a single device
/*! The printer drivers only ever talk to a device through one of
 *  these.  Implementations deal with whatever it takes to move the
 *  octets across and report failures by throwing an io_error, or a
 *  timeout_error when nothing happened within the \a timeout (in
 *  seconds).
 *
 *  Nothing is buffered on this level.  A message handed to send()
 *  has been accepted by the other end when the call returns.
 */
class connexion
{
public:
  typedef shared_ptr< connexion > ptr;

  virtual ~connexion () {}

  virtual void send (const octet *message, streamsize size) = 0;
  virtual void send (const octet *message, streamsize size,
                     double timeout) = 0;

  //! Reads up to \a size octets into \a message
  /*! Returns the number of octets actually received.  This may be
   *  less than \a size when the device sent a short frame.
   */
  virtual streamsize recv (octet *message, streamsize size) = 0;
  virtual streamsize recv (octet *message, streamsize size,
                           double timeout) = 0;

  //! Creates a connexion of a given \a type to the device at \a path
  /*! The only \a type supported at the moment is \c "usb".  Its \a
   *  path takes the form \c VID:PID or \c VID:PID:INDEX, with the
   *  IDs in hexadecimal and INDEX selecting among identical devices.
   *  Passing \a debug wraps the result in a hexdump decorator.
   */
  static connexion::ptr create (const std::string& type,
                                const std::string& path,
                                const bool debug = false);
};

template<>
class decorator< connexion >
  : public connexion
{
public:
  typedef shared_ptr< connexion > ptr;

  decorator (ptr instance);

  virtual void send (const octet *message, streamsize size);
  virtual void send (const octet *message, streamsize size, double timeout);
  virtual streamsize recv (octet *message, streamsize size);
  virtual streamsize recv (octet *message, streamsize size, double timeout);

protected:
  typedef decorator base_;

  ptr instance_;
};

}       // namespace ptouch

#endif  /* ptouch_connexion_hpp_ */
