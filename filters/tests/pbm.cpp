//  pbm.cpp -- unit tests for the PBM reader
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

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "../pbm.hpp"

using ptouch::_flt_::pbm;

namespace {

std::string
image (const std::string& header, const std::string& data)
{
  return header + data;
}

}       // namespace

BOOST_AUTO_TEST_CASE (small_image)
{
  // a 10x2 image, with row padding
  std::istringstream is (image ("P4\n10 2\n",
                                std::string ("\xc0\x40\x80\x80", 4)));
  pbm img (pbm::read (is));

  BOOST_REQUIRE_EQUAL (10, img.width ());
  BOOST_REQUIRE_EQUAL (2, img.height ());

  BOOST_CHECK ( img.pixel (0, 0));
  BOOST_CHECK ( img.pixel (1, 0));
  BOOST_CHECK (!img.pixel (2, 0));
  BOOST_CHECK ( img.pixel (9, 0));
  BOOST_CHECK ( img.pixel (0, 1));
  BOOST_CHECK (!img.pixel (1, 1));
  BOOST_CHECK ( img.pixel (8, 1));
  BOOST_CHECK (!img.pixel (9, 1));
}

BOOST_AUTO_TEST_CASE (columns)
{
  std::istringstream is (image ("P4 3 2 ", std::string ("\xa0\x40", 2)));
  pbm img (pbm::read (is));

  std::vector< bool > c0 (img.column (0));
  std::vector< bool > c1 (img.column (1));

  BOOST_REQUIRE_EQUAL (2, c0.size ());
  BOOST_CHECK ( c0[0]);
  BOOST_CHECK (!c0[1]);
  BOOST_CHECK (!c1[0]);
  BOOST_CHECK ( c1[1]);
}

BOOST_AUTO_TEST_CASE (header_comments)
{
  std::istringstream is (image ("P4\n# made by hand\n8 # width\n1\n",
                                std::string ("\xff", 1)));
  pbm img (pbm::read (is));

  BOOST_CHECK_EQUAL (8, img.width ());
  BOOST_CHECK_EQUAL (1, img.height ());
  BOOST_CHECK (img.pixel (7, 0));
}

BOOST_AUTO_TEST_CASE (plain_bitmap_rejected)
{
  std::istringstream is ("P1\n2 1\n1 0\n");

  BOOST_CHECK_THROW (pbm::read (is), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (truncated_data)
{
  std::istringstream is (image ("P4\n8 3\n", std::string ("\xff\x00", 2)));

  BOOST_CHECK_THROW (pbm::read (is), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (bad_size)
{
  std::istringstream zero ("P4\n0 3\n");
  std::istringstream junk ("P4\nwide 3\n");

  BOOST_CHECK_THROW (pbm::read (zero), std::runtime_error);
  BOOST_CHECK_THROW (pbm::read (junk), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (oversized_header)
{
  std::istringstream huge (image ("P4 8 2305843009213693952\n",
                                  std::string ("\xff\xff\xff\xff", 4)));
  std::istringstream tall (image ("P4 8 65536\n",
                                  std::string ("\xff\xff", 2)));
  std::istringstream wide (image ("P4 65536 1\n",
                                  std::string ("\xff\xff", 2)));

  BOOST_CHECK_THROW (pbm::read (huge), std::runtime_error);
  BOOST_CHECK_THROW (pbm::read (tall), std::runtime_error);
  BOOST_CHECK_THROW (pbm::read (wide), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (largest_accepted_size)
{
  std::string row (pbm::max_size / 8 + 1, '\0');
  std::istringstream is (image ("P4 65535 1\n", row));
  pbm img (pbm::read (is));

  BOOST_CHECK_EQUAL (pbm::max_size, img.width ());
  BOOST_CHECK_EQUAL (1, img.height ());
}

#include "ptouch/test/runner.ipp"
