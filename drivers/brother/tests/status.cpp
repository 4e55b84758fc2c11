//  status.cpp -- unit tests for status reply decoding
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

#include "../exception.hpp"
#include "../status.hpp"
#include "tools.hpp"

using namespace ptouch::_drv_::brother;
using ptouch::_drv_::brother::test::status_frame;
using ptouch::streamsize;

BOOST_AUTO_TEST_CASE (round_trip)
{
  status_frame f;
  f.error_flags  = error_flag::WEAK_BATTERIES | error_flag::OVERHEATING;
  f.width        = 18;
  f.kind         = 0x01;
  f.mode         = 0x40;
  f.type         = status::PHASE_CHANGE;
  f.phase        = status::PRINTING;
  f.phase_number = 0x0102;
  f.notification = status::COVER_CLOSED;
  f.tape_colour  = 0x05;
  f.text_colour  = 0x04;

  status st (status::decode (f.bytes ()));

  BOOST_CHECK_EQUAL (f.error_flags, st.error_flags ());
  BOOST_CHECK (st.has_error ());
  BOOST_CHECK (media (media::LAMINATED_TAPE, 18) == st.media ());
  BOOST_CHECK_EQUAL (0x40, st.mode ());
  BOOST_CHECK_EQUAL (status::PHASE_CHANGE, st.type ());
  BOOST_CHECK_EQUAL (status::PRINTING, st.phase ());
  BOOST_CHECK_EQUAL (0x0102, st.phase_number ());
  BOOST_CHECK_EQUAL (status::COVER_CLOSED, st.notification ());
  BOOST_CHECK_EQUAL (0x68, st.model_code ());
  BOOST_CHECK_EQUAL (0x05, st.tape_colour ());
  BOOST_CHECK_EQUAL (0x04, st.text_colour ());
  BOOST_CHECK (f.bytes () == st.raw ());
}

BOOST_AUTO_TEST_CASE (no_error_reply)
{
  status st (status::decode (status_frame ().bytes ()));

  BOOST_CHECK (!st.has_error ());
  BOOST_CHECK_EQUAL (status::REPLY, st.type ());
  BOOST_CHECK (media (media::CONTINUOUS_TAPE, 12) == st.media ());
}

BOOST_AUTO_TEST_CASE (error_flag_bytes)
{
  status st (status::decode (status_frame ()
                             .with_flags (error_flag::COVER_OPEN)
                             .with_type (status::ERROR_OCCURRED)
                             .bytes ()));

  BOOST_CHECK_EQUAL (0x10, st.raw ()[9]);
  BOOST_CHECK_EQUAL (0x00, st.raw ()[8]);
  BOOST_CHECK_EQUAL (error_flag::COVER_OPEN, st.error_flags ());
  BOOST_CHECK_EQUAL (status::ERROR_OCCURRED, st.type ());
}

BOOST_AUTO_TEST_CASE (bad_length)
{
  byte_buffer frame (status_frame ().bytes ());
  frame.resize (64, 0x00);

  for (streamsize sz = 0; sz <= 64; ++sz)
    {
      if (status::size == sz) continue;

      try
        {
          status::decode (frame.data (), sz);
          BOOST_ERROR ("no decode_error for size " << sz);
        }
      catch (const decode_error& e)
        {
          BOOST_CHECK_EQUAL (decode_error::BAD_LENGTH, e.reason ());
        }
    }
}

BOOST_AUTO_TEST_CASE (bad_signature)
{
  for (int i = 0; i < 4; ++i)
    {
      byte_buffer frame (status_frame ().bytes ());
      frame[i] = ~frame[i];

      try
        {
          status::decode (frame);
          BOOST_ERROR ("no decode_error for offset " << i);
        }
      catch (const decode_error& e)
        {
          BOOST_CHECK_EQUAL (decode_error::BAD_SIGNATURE, e.reason ());
        }
    }
}

BOOST_AUTO_TEST_CASE (unknown_status_type)
{
  status st (status::decode (status_frame ().with_type (0x42).bytes ()));

  BOOST_CHECK_EQUAL (status::UNKNOWN_TYPE, st.type ());
}

BOOST_AUTO_TEST_CASE (describe_error_flags)
{
  BOOST_CHECK_EQUAL (std::string (), error_flag::describe (0));
  BOOST_CHECK_EQUAL (std::string ("cover open"),
                     error_flag::describe (error_flag::COVER_OPEN));
  BOOST_CHECK_EQUAL (std::string ("no media, cutter jam, system error"),
                     error_flag::describe (error_flag::NO_MEDIA
                                           | error_flag::CUTTER_JAM
                                           | error_flag::SYSTEM_ERROR));
}

BOOST_AUTO_TEST_CASE (colour_names)
{
  status st (status::decode (status_frame ().bytes ()));

  BOOST_CHECK_EQUAL (std::string ("white"),
                     status::colour_name (st.tape_colour ()));
  BOOST_CHECK_EQUAL (std::string ("black"),
                     status::colour_name (st.text_colour ()));
  BOOST_CHECK_EQUAL (std::string ("gold"), status::colour_name (0x0a));
  BOOST_CHECK_EQUAL (std::string ("incompatible"),
                     status::colour_name (static_cast< byte > (0xff)));
  BOOST_CHECK_EQUAL (std::string ("unknown"), status::colour_name (0x00));
}

#include "ptouch/test/runner.ipp"
