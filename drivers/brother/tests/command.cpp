//  command.cpp -- unit tests for raster command encoding
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

#include "../command.hpp"
#include "../compression.hpp"
#include "tools.hpp"

using namespace ptouch::_drv_::brother;
using ptouch::_drv_::brother::test::from_hex;

BOOST_AUTO_TEST_CASE (invalidate_bytes)
{
  byte_buffer buf (encode (invalidate ()));

  BOOST_CHECK_EQUAL (200, buf.size ());
  BOOST_CHECK (byte_buffer (200, 0x00) == buf);
}

BOOST_AUTO_TEST_CASE (single_purpose_commands)
{
  BOOST_CHECK (from_hex ("1b40")   == encode (initialize ()));
  BOOST_CHECK (from_hex ("1b6953") == encode (status_request ()));
  BOOST_CHECK (from_hex ("0c")     == encode (print_no_feed ()));
  BOOST_CHECK (from_hex ("1a")     == encode (print_and_feed ()));
}

BOOST_AUTO_TEST_CASE (switch_mode_bytes)
{
  BOOST_CHECK (from_hex ("1b696101")
               == encode (switch_mode (switch_mode::RASTER)));
  BOOST_CHECK (from_hex ("1b696100")
               == encode (switch_mode (switch_mode::ESC_P)));
  BOOST_CHECK (from_hex ("1b696103")
               == encode (switch_mode (switch_mode::TEMPLATE)));
}

BOOST_AUTO_TEST_CASE (status_notify_bytes)
{
  BOOST_CHECK (from_hex ("1b692100") == encode (set_status_notify (true)));
  BOOST_CHECK (from_hex ("1b692101") == encode (set_status_notify (false)));
}

BOOST_AUTO_TEST_CASE (print_information_for_media)
{
  media m (media::LAMINATED_TAPE, 24);
  set_media_and_quality cmd (m, 0x0102, set_media_and_quality::LAST_PAGE);

  BOOST_CHECK (from_hex ("1b697a 86 01 18 00 02010000 02 00")
               == encode (cmd));
}

BOOST_AUTO_TEST_CASE (print_information_without_media)
{
  set_media_and_quality cmd;
  cmd.recover = false;
  cmd.quality = true;
  cmd.raster_count = 0x01020304;

  byte_buffer buf (encode (cmd));

  BOOST_CHECK_EQUAL (13, buf.size ());
  BOOST_CHECK (from_hex ("1b697a 40 00 00 00 04030201 00 00") == buf);
}

BOOST_AUTO_TEST_CASE (print_information_for_die_cut_labels)
{
  media m (media::DIE_CUT_LABEL, 12, 29);
  set_media_and_quality cmd (m, 3, set_media_and_quality::FIRST_PAGE);

  BOOST_CHECK (from_hex ("1b697a 8e 0b 0c 1d 03000000 00 00")
               == encode (cmd));
}

BOOST_AUTO_TEST_CASE (mode_settings)
{
  BOOST_CHECK (from_hex ("1b694d40")
               == encode (set_various_mode (various_mode::AUTO_CUT)));
  BOOST_CHECK (from_hex ("1b694dc0")
               == encode (set_various_mode (various_mode::AUTO_CUT
                                            | various_mode::MIRROR)));
  BOOST_CHECK (from_hex ("1b694b48")
               == encode (set_advanced_mode (advanced_mode::NO_CHAIN
                                             | advanced_mode::HIGH_RESOLUTION)));
  BOOST_CHECK (from_hex ("1b694b00") == encode (set_advanced_mode ()));
}

BOOST_AUTO_TEST_CASE (margin_is_little_endian)
{
  BOOST_CHECK (from_hex ("1b69640e00") == encode (set_margin (14)));
  BOOST_CHECK (from_hex ("1b69643412") == encode (set_margin (0x1234)));
}

BOOST_AUTO_TEST_CASE (cut_every_bytes)
{
  BOOST_CHECK (from_hex ("1b694105") == encode (set_cut_every (5)));
}

BOOST_AUTO_TEST_CASE (compression_bytes)
{
  BOOST_CHECK (from_hex ("4d02") == encode (set_compression (true)));
  BOOST_CHECK (from_hex ("4d00") == encode (set_compression (false)));
}

BOOST_AUTO_TEST_CASE (plain_raster_transfer)
{
  raster_line line (from_hex ("00000000 00ff8001 00000000 00000000"));

  byte_buffer expect (from_hex ("471000"));
  expect += line;

  BOOST_CHECK (expect == encode (raster_transfer (line)));
}

BOOST_AUTO_TEST_CASE (compressed_raster_transfer)
{
  raster_line line (from_hex ("00000000 00ff8001 00000000 00000000"));
  byte_buffer packed (pack_bits (line));

  byte_buffer expect;
  expect.push_back (0x47);
  expect.push_back (packed.size ());
  expect.push_back (0x00);
  expect += packed;

  BOOST_CHECK (expect == encode (raster_transfer (line, true)));
}

BOOST_AUTO_TEST_CASE (blank_raster_line)
{
  raster_line line (16, 0x00);

  BOOST_CHECK (from_hex ("5a") == encode (raster_transfer (line)));
  BOOST_CHECK (from_hex ("5a") == encode (raster_transfer (line, true)));
}

BOOST_AUTO_TEST_CASE (command_names)
{
  BOOST_CHECK_EQUAL (std::string ("raster transfer"),
                     name (raster_transfer ()));
  BOOST_CHECK_EQUAL (std::string ("print and feed"),
                     name (print_and_feed ()));
  BOOST_CHECK_EQUAL (std::string ("status request"),
                     name (status_request ()));
}

#include "ptouch/test/runner.ipp"
