//  usb.cpp -- shuttle messages between software and USB device
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

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/throw_exception.hpp>

#include "ptouch/exception.hpp"
#include "ptouch/log.hpp"

#include "usb.hpp"

namespace ptouch {
namespace _cnx_ {

using std::invalid_argument;

namespace {

unsigned long
parse_hex_(const std::string& field, const std::string& path,
           unsigned long limit)
{
  std::istringstream is (field);
  unsigned long value;

  is >> std::hex >> std::noskipws >> value;
  if (field.empty () || !is || !is.eof () || limit < value)
    BOOST_THROW_EXCEPTION
      (invalid_argument ((format ("malformed USB device address: '%1%'")
                          % path).str ()));
  return value;
}

}       // namespace

usb_address
usb_address::parse (const std::string& path)
{
  std::vector< std::string > fields;
  boost::algorithm::split (fields, path, boost::algorithm::is_any_of (":"));

  if (2 != fields.size () && 3 != fields.size ())
    BOOST_THROW_EXCEPTION
      (invalid_argument ((format ("malformed USB device address: '%1%'")
                          % path).str ()));

  usb_address rv (parse_hex_(fields[0], path, 0xffff),
                  parse_hex_(fields[1], path, 0xffff));
  if (3 == fields.size ())
    rv.index = parse_hex_(fields[2], path, 0xff);

  return rv;
}

std::string
usb_address::str () const
{
  std::ostringstream os;
  os << std::hex << std::setfill ('0')
     << std::setw (4) << vendor_id << ":"
     << std::setw (4) << product_id << ":"
     << index;
  return os.str ();
}

connexion::ptr
usb_factory (const std::string& path)
{
  usb_address address (usb_address::parse (path));

#if HAVE_LIBUSB
  return make_shared< usb > (address);
#else
  log::alert ("USB support disabled at compile time");
  BOOST_THROW_EXCEPTION
    (io_error ((format ("%1%: USB support disabled at compile time")
                % address.str ()).str ()));
#endif
}

usb_info
usb_device_info (const std::string& path)
{
  usb_address address (usb_address::parse (path));

#if HAVE_LIBUSB
  usb dev (address);
  return dev.info ();
#else
  log::alert ("USB support disabled at compile time");
  BOOST_THROW_EXCEPTION
    (io_error ((format ("%1%: USB support disabled at compile time")
                % address.str ()).str ()));
#endif
}

std::ostream&
operator<< (std::ostream& os, const usb_info& info)
{
  return os << "manufacturer  : " << info.manufacturer << "\n"
            << "product       : " << info.product << "\n"
            << "serial number : " << info.serial_number << "\n";
}

#if HAVE_LIBUSB

  const int milliseconds =    1;
  const int seconds      = 1000 * milliseconds;

  bool usb::is_initialised_  = false;
  int  usb::default_timeout_ = 5 * seconds;
  libusb_context *usb::ctx_  = 0;
  int usb::connexion_count_  = 0;

  usb::usb (const usb_address& address)
    : handle_(0), if_(0), ep_bulk_i_(-1), ep_bulk_o_(-1)
  {
    if (!is_initialised_)
      {
        int err = libusb_init (&ctx_);
        is_initialised_ = !err;

        if (err)
          {
            ctx_ = 0;
            log::error (libusb_error_name (err));
            BOOST_THROW_EXCEPTION
              (io_error ("unable to initialise USB support"));
          }
      }

    libusb_device **haystack;
    ssize_t cnt = libusb_get_device_list (ctx_, &haystack);
    unsigned seen = 0;

    for (ssize_t i = 0; !handle_ && i < cnt; i++)
      {
        struct libusb_device_descriptor descriptor;

        if (libusb_get_device_descriptor (haystack[i], &descriptor)
            || address.vendor_id  != descriptor.idVendor
            || address.product_id != descriptor.idProduct)
          continue;

        if (address.index == seen++)
          handle_ = usable_match_(haystack[i]);
      }

    if (0 <= cnt) libusb_free_device_list (haystack, 1);

    if (!handle_)
      {
        if (0 == connexion_count_)
          {
            libusb_exit (ctx_);
            ctx_ = 0;
            is_initialised_ = false;
          }
        BOOST_THROW_EXCEPTION
          (io_error ((format ("%1%: no usable, matching device")
                      % address.str ()).str ()));
      }

    ++connexion_count_;
    log::brief ("opened USB connexion to %1%") % address.str ();
  }

  usb::~usb (void)
  {
    libusb_release_interface (handle_, if_);
    libusb_close (handle_);

    if (0 == --connexion_count_)
      {
        libusb_exit (ctx_);
        ctx_ = 0;
        is_initialised_ = false;
      }
  }

  void
  usb::send (const octet *message, streamsize size)
  {
    return send (message, size, 0.001 * default_timeout_);
  }

  void
  usb::send (const octet *message, streamsize size, double timeout)
  {
    unsigned char *buf = reinterpret_cast<unsigned char *>
      (const_cast<octet *> (message));

    int transferred = 0;
    int err = libusb_bulk_transfer (handle_, ep_bulk_o_, buf, size,
                                    &transferred, 1000 * timeout);

    if (LIBUSB_ERROR_PIPE == err)
      libusb_clear_halt (handle_, ep_bulk_o_);

    throw_on_error_(err, "send");

    if (transferred != size)
      {
        log::error ("short write: %1% of %2% octets") % transferred % size;
        BOOST_THROW_EXCEPTION (io_error ("short write"));
      }
  }

  streamsize
  usb::recv (octet *message, streamsize size)
  {
    return recv (message, size, 0.001 * default_timeout_);
  }

  streamsize
  usb::recv (octet *message, streamsize size, double timeout)
  {
    unsigned char *buf = reinterpret_cast<unsigned char *> (message);

    int transferred = 0;
    int err = libusb_bulk_transfer (handle_, ep_bulk_i_, buf, size,
                                    &transferred, 1000 * timeout);

    if (LIBUSB_ERROR_PIPE == err)
      libusb_clear_halt (handle_, ep_bulk_i_);

    throw_on_error_(err, "recv");

    return transferred;
  }

  usb_info
  usb::info () const
  {
    struct libusb_device_descriptor descriptor;

    int err = libusb_get_device_descriptor (libusb_get_device (handle_),
                                            &descriptor);
    throw_on_error_(err, "device descriptor");

    usb_info rv;
    rv.manufacturer  = string_descriptor_(descriptor.iManufacturer,
                                          "manufacturer");
    rv.product       = string_descriptor_(descriptor.iProduct,
                                          "product");
    rv.serial_number = string_descriptor_(descriptor.iSerialNumber,
                                          "serial number");
    return rv;
  }

  //! Returns an empty string for devices that lack the descriptor
  std::string
  usb::string_descriptor_(uint8_t index, const char *what) const
  {
    if (!index) return std::string ();

    unsigned char buf[256];
    int n = libusb_get_string_descriptor_ascii (handle_, index,
                                                buf, sizeof (buf));
    if (0 > n) throw_on_error_(n, what);

    return std::string (reinterpret_cast< char * > (buf), n);
  }

  void
  usb::throw_on_error_(int err, const char *what) const
  {
    if (!err) return;

    if (LIBUSB_ERROR_TIMEOUT == err)
      {
        log::trace ("%1%: %2%") % what % libusb_error_name (err);
        BOOST_THROW_EXCEPTION (timeout_error ());
      }

    log::error ("%1%: %2%") % what % libusb_error_name (err);
    BOOST_THROW_EXCEPTION
      (io_error ((format ("%1%: %2%") % what
                  % libusb_error_name (err)).str ()));
  }

  libusb_device_handle *
  usb::usable_match_(libusb_device *dev)
  {
    int err = libusb_open (dev, &handle_);
    if (err)
      {
        log::error ("%1%: open: %2%")
          % __func__
          % libusb_error_name (err);
        return NULL;
      }

    // The printers show up as printer class devices and the kernel's
    // usblp driver will have claimed them.
    libusb_set_auto_detach_kernel_driver (handle_, 1);

    err = libusb_claim_interface (handle_, if_);
    if (err)
      {
        log::error ("%1%: claim interface: %2%")
          %  __func__
          % libusb_error_name (err);

        libusb_close (handle_);
        handle_ = NULL;
        return NULL;
      }

    if (set_bulk_endpoints_(dev))
      return handle_;   // we got a usable match!

    log::error ("%1%: no bulk endpoint pair on interface %2%")
      % __func__
      % if_;

    libusb_release_interface (handle_, if_);
    libusb_close (handle_);
    handle_ = NULL;
    return NULL;
  }

  bool
  usb::set_bulk_endpoints_(libusb_device *dev)
  {
    if (!dev) return false;

    struct libusb_config_descriptor *config;

    int err = libusb_get_active_config_descriptor (dev, &config);
    if (err)
      {
        log::error ("%1%: %2%") % __func__ % libusb_error_name (err);
        return false;
      }

    for (int a = 0; a < config->interface[if_].num_altsetting; ++a)
      {
        const struct libusb_interface_descriptor *id
          = &config->interface[if_].altsetting[a];

        for (int n = 0; n < id->bNumEndpoints; ++n)
          {
            const struct libusb_endpoint_descriptor *ep = &id->endpoint[n];

            if (LIBUSB_TRANSFER_TYPE_BULK
                == (LIBUSB_TRANSFER_TYPE_MASK & ep->bmAttributes))
              {
                if (LIBUSB_ENDPOINT_DIR_MASK & ep->bEndpointAddress)
                  ep_bulk_i_ = ep->bEndpointAddress;
                else
                  ep_bulk_o_ = ep->bEndpointAddress;
              }
          }
      }
    libusb_free_config_descriptor (config);

    return (-1 != ep_bulk_i_ && -1 != ep_bulk_o_);
  }

#endif  /* HAVE_LIBUSB */

} // namespace _cnx_
} // namespace ptouch
