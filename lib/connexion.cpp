//  connexion.cpp -- transport a byte stream to and from a device
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "ptouch/connexion.hpp"
#include "ptouch/exception.hpp"
#include "ptouch/log.hpp"
#include "connexions/usb.hpp"
#include "connexions/hexdump.hpp"

namespace ptouch {

connexion::ptr
connexion::create (const std::string& type, const std::string& path,
                   const bool debug)
{
  ptr cnx;

  if ("usb" == type)
    {
      cnx = _cnx_::usb_factory (path);
    }
  else
    {
      log::fatal ("unsupported connexion type: '%1%'") % type;
      BOOST_THROW_EXCEPTION
        (std::invalid_argument ((format ("unsupported connexion type: '%1%'")
                                 % type).str ()));
    }

  if (debug)
    {
      cnx = make_shared< _cnx_::hexdump > (cnx);
    }

  return cnx;
}

decorator<connexion>::decorator (ptr instance)
  : instance_(instance)
{}

void
decorator<connexion>::send (const octet *message, streamsize size)
{
  instance_->send (message, size);
}

void
decorator<connexion>::send (const octet *message, streamsize size,
                            double timeout)
{
  instance_->send (message, size, timeout);
}

streamsize
decorator<connexion>::recv (octet *message, streamsize size)
{
  return instance_->recv (message, size);
}

streamsize
decorator<connexion>::recv (octet *message, streamsize size,
                            double timeout)
{
  return instance_->recv (message, size, timeout);
}

}       // namespace ptouch
