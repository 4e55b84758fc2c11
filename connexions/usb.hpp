//  usb.hpp -- shuttle messages between software and USB device
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

#ifndef connexions_usb_hpp_
#define connexions_usb_hpp_

#if HAVE_LIBUSB
#include <libusb.h>
#endif

#include <ostream>
#include <string>

#include "ptouch/connexion.hpp"
#include "ptouch/octet.hpp"

namespace ptouch {
namespace _cnx_ {

//! Identifies one device among those attached to the USB
struct usb_address
{
  uint16_t vendor_id;
  uint16_t product_id;
  unsigned index;               //!< among devices with identical IDs

  usb_address (uint16_t vid = 0, uint16_t pid = 0, unsigned idx = 0)
    : vendor_id (vid), product_id (pid), index (idx)
  {}

  //! Parses \c VID:PID or \c VID:PID:INDEX with hexadecimal IDs
  /*! Throws a std::invalid_argument when \a path does not parse.
   */
  static usb_address parse (const std::string& path);

  std::string str () const;
};

//! Identification strings a USB device reports about itself
struct usb_info
{
  std::string manufacturer;
  std::string product;
  std::string serial_number;
};

std::ostream& operator<< (std::ostream& os, const usb_info& info);

//! Creates a USB connexion to the device at \a path
/*! Throws an io_error when support for USB has been disabled at
 *  compile time or no usable device can be found.
 */
connexion::ptr usb_factory (const std::string& path);

//! Reads the identification strings of the device at \a path
/*! The device is opened and closed again, so this cannot be used
 *  while a connexion to the same device is open.  Failures are thrown
 *  like those of usb_factory().
 */
usb_info usb_device_info (const std::string& path);

#if HAVE_LIBUSB

  class usb : public connexion
  {
  public:
    usb (const usb_address& address);

    virtual ~usb (void);

    virtual void send (const octet *message, streamsize size);
    virtual void send (const octet *message, streamsize size, double timeout);
    virtual streamsize recv (octet *message, streamsize size);
    virtual streamsize recv (octet *message, streamsize size, double timeout);

    usb_info info () const;

  private:
    std::string string_descriptor_(uint8_t index, const char *what) const;
    libusb_device_handle * usable_match_(libusb_device *dev);
    bool set_bulk_endpoints_(libusb_device *dev);
    void throw_on_error_(int err, const char *what) const;

    libusb_device_handle *handle_;
    int if_;
    int ep_bulk_i_;
    int ep_bulk_o_;

    static bool is_initialised_;
    static int  default_timeout_;

    static libusb_context *ctx_;
    static int connexion_count_;
  };

#endif  /* HAVE_LIBUSB */

} // namespace _cnx_
} // namespace ptouch

#endif  /* connexions_usb_hpp_ */
