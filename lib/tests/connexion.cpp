//  connexion.cpp -- unit tests for the ptouch::connexion API
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
#include <string>

#include <boost/test/unit_test.hpp>

#include "ptouch/connexion.hpp"
#include "ptouch/exception.hpp"
#include "ptouch/test/connexion.hpp"

using namespace ptouch;
using ptouch::test::scripted_connexion;

namespace {

//!  Counts the calls that pass through it
class counter
  : public decorator< connexion >
{
public:
  int sends;
  int recvs;

  counter (connexion::ptr instance)
    : base_(instance), sends (0), recvs (0)
  {}

  using base_::send;
  using base_::recv;

  void send (const octet *message, streamsize size)
  {
    ++sends;
    base_::send (message, size);
  }

  streamsize recv (octet *message, streamsize size, double timeout)
  {
    ++recvs;
    return base_::recv (message, size, timeout);
  }
};

}       // namespace

BOOST_AUTO_TEST_CASE (decorator_forwarding)
{
  shared_ptr< scripted_connexion > cnx (make_shared< scripted_connexion > ());
  decorator< connexion > d (cnx);

  const octet msg[] = { 0x1b, 0x40 };
  d.send (msg, sizeof (msg));
  d.send (msg, 1, 1.0);

  BOOST_REQUIRE_EQUAL (2, cnx->sent.size ());
  BOOST_CHECK_EQUAL (std::string (msg, 2), cnx->sent[0]);
  BOOST_CHECK_EQUAL (std::string (msg, 1), cnx->sent[1]);

  cnx->queue_reply ("abc");
  octet buf[8];
  BOOST_CHECK_EQUAL (3, d.recv (buf, sizeof (buf)));
  BOOST_CHECK_EQUAL ("abc", std::string (buf, 3));

  BOOST_CHECK_THROW (d.recv (buf, sizeof (buf), 0.1), timeout_error);
}

BOOST_AUTO_TEST_CASE (partial_override)
{
  shared_ptr< scripted_connexion > cnx (make_shared< scripted_connexion > ());
  counter c (cnx);

  const octet msg[] = { 0x1b, 0x69, 0x53 };
  c.send (msg, sizeof (msg));
  c.send (msg, sizeof (msg), 1.0);

  cnx->queue_reply ("x");
  octet buf[4];
  c.recv (buf, sizeof (buf), 1.0);

  BOOST_CHECK_EQUAL (1, c.sends);
  BOOST_CHECK_EQUAL (1, c.recvs);
  BOOST_CHECK_EQUAL (2, cnx->sent.size ());
}

BOOST_AUTO_TEST_CASE (short_reply)
{
  shared_ptr< scripted_connexion > cnx (make_shared< scripted_connexion > ());
  cnx->queue_reply ("hello, world");

  octet buf[5];
  BOOST_CHECK_EQUAL (5, cnx->recv (buf, sizeof (buf)));
  BOOST_CHECK_EQUAL ("hello", std::string (buf, 5));
}

BOOST_AUTO_TEST_CASE (unsupported_type)
{
  BOOST_CHECK_THROW (connexion::create ("bluetooth", "04f9:2062"),
                     std::invalid_argument);
}

BOOST_AUTO_TEST_CASE (malformed_usb_path)
{
  BOOST_CHECK_THROW (connexion::create ("usb", "brother"),
                     std::invalid_argument);
  BOOST_CHECK_THROW (connexion::create ("usb", "04f9:2062:0:1", true),
                     std::invalid_argument);
}

#include "ptouch/test/runner.ipp"
