//  exception.cpp -- unit tests for ptouch exceptions
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

#include <string>

#include <boost/test/unit_test.hpp>

#include "ptouch/exception.hpp"

using namespace ptouch;

BOOST_AUTO_TEST_CASE (default_system_error)
{
  system_error e;

  BOOST_CHECK_EQUAL (system_error::no_error, e.code ());
}

BOOST_AUTO_TEST_CASE (described_system_error)
{
  system_error e (system_error::cover_open);

  BOOST_CHECK_EQUAL (system_error::cover_open, e.code ());
  BOOST_CHECK_EQUAL (std::string ("cover open"), e.what ());
}

BOOST_AUTO_TEST_CASE (custom_message)
{
  system_error e (system_error::media_out, "no tape");

  BOOST_CHECK_EQUAL (system_error::media_out, e.code ());
  BOOST_CHECK_EQUAL (std::string ("no tape"), e.what ());
}

BOOST_AUTO_TEST_CASE (descriptions)
{
  for (int ec = system_error::no_error;
       ec <= system_error::unknown_error; ++ec)
    {
      std::string s (system_error::describe
                     (static_cast< system_error::error_code > (ec)));
      BOOST_CHECK (!s.empty ());
    }
  BOOST_CHECK_EQUAL (std::string ("unknown error"),
                     system_error::describe (system_error::unknown_error));
}

BOOST_AUTO_TEST_CASE (timeout_is_io_error)
{
  BOOST_CHECK_THROW (throw timeout_error (), io_error);

  timeout_error e;
  BOOST_CHECK_EQUAL (std::string ("timed out"), e.what ());
}

#include "ptouch/test/runner.ipp"
