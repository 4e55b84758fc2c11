//  media.cpp -- unit tests for the media model
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

#include <boost/optional.hpp>
#include <boost/test/unit_test.hpp>

#include "../media.hpp"
#include "../model.hpp"

using namespace ptouch::_drv_::brother;

BOOST_AUTO_TEST_CASE (known_identifiers)
{
  BOOST_CHECK_EQUAL (media::NO_MEDIA,
                     media::from_status (0x00, 0, 0).kind ());
  BOOST_CHECK_EQUAL (media::LAMINATED_TAPE,
                     media::from_status (0x01, 12, 0).kind ());
  BOOST_CHECK_EQUAL (media::NON_LAMINATED_TAPE,
                     media::from_status (0x03, 12, 0).kind ());
  BOOST_CHECK_EQUAL (media::HEAT_SHRINK_TUBE,
                     media::from_status (0x11, 12, 0).kind ());
  BOOST_CHECK_EQUAL (media::CONTINUOUS_TAPE,
                     media::from_status (0x0a, 12, 0).kind ());
  BOOST_CHECK_EQUAL (media::DIE_CUT_LABEL,
                     media::from_status (0x0b, 12, 29).kind ());
  BOOST_CHECK_EQUAL (media::INCOMPATIBLE,
                     media::from_status (static_cast< byte > (0xff),
                                         0, 0).kind ());
}

BOOST_AUTO_TEST_CASE (unknown_identifier)
{
  media m (media::from_status (0x42, 24, 0));

  BOOST_CHECK_EQUAL (media::UNKNOWN, m.kind ());
  BOOST_CHECK_EQUAL (24, m.width_mm ());
}

BOOST_AUTO_TEST_CASE (kind_code_round_trip)
{
  media m (media::HEAT_SHRINK_TUBE, 9);

  BOOST_CHECK_EQUAL (0x11, m.kind_code ());
  BOOST_CHECK (m == media::from_status (m.kind_code (), 9, 0));
}

BOOST_AUTO_TEST_CASE (compatible_without_hint)
{
  media m (media::LAMINATED_TAPE, 12);

  BOOST_CHECK (m.is_compatible (boost::none));
}

BOOST_AUTO_TEST_CASE (width_mismatch)
{
  media m (media::LAMINATED_TAPE, 12);

  BOOST_CHECK (!m.is_compatible (media (media::LAMINATED_TAPE, 24)));
  BOOST_CHECK (!m.is_compatible (media (media::UNKNOWN, 24)));
  BOOST_CHECK ( m.is_compatible (media (media::LAMINATED_TAPE, 12)));
}

BOOST_AUTO_TEST_CASE (kind_mismatch)
{
  media m (media::LAMINATED_TAPE, 12);

  BOOST_CHECK (!m.is_compatible (media (media::HEAT_SHRINK_TUBE, 12)));
  BOOST_CHECK (!m.is_compatible (media (media::NON_LAMINATED_TAPE, 0)));
}

BOOST_AUTO_TEST_CASE (continuous_hint_on_pt_tape)
{
  media hint (media::CONTINUOUS_TAPE, 12);

  BOOST_CHECK ( media (media::LAMINATED_TAPE, 12).is_compatible (hint));
  BOOST_CHECK ( media (media::NON_LAMINATED_TAPE, 12).is_compatible (hint));
  BOOST_CHECK ( media (media::CONTINUOUS_TAPE, 12).is_compatible (hint));
  BOOST_CHECK (!media (media::LAMINATED_TAPE, 24).is_compatible (hint));
  BOOST_CHECK (!media (media::HEAT_SHRINK_TUBE, 12).is_compatible (hint));
  BOOST_CHECK (!media (media::DIE_CUT_LABEL, 12).is_compatible (hint));

  // the other way round stays strict
  BOOST_CHECK (!media (media::CONTINUOUS_TAPE, 12)
               .is_compatible (media (media::LAMINATED_TAPE, 12)));
}

BOOST_AUTO_TEST_CASE (wildcard_hints)
{
  media m (media::NON_LAMINATED_TAPE, 9);

  BOOST_CHECK (m.is_compatible (media ()));
  BOOST_CHECK (m.is_compatible (media (media::UNKNOWN, 9)));
  BOOST_CHECK (m.is_compatible (media (media::NON_LAMINATED_TAPE, 0)));
}

BOOST_AUTO_TEST_CASE (die_cut_length)
{
  media m (media::DIE_CUT_LABEL, 12, 29);

  BOOST_CHECK ( m.is_compatible (media (media::DIE_CUT_LABEL, 12, 29)));
  BOOST_CHECK ( m.is_compatible (media (media::DIE_CUT_LABEL, 12)));
  BOOST_CHECK (!m.is_compatible (media (media::DIE_CUT_LABEL, 12, 62)));
}

BOOST_AUTO_TEST_CASE (tape_print_areas)
{
  BOOST_CHECK (media::area (52,  24)
               == *media (media::LAMINATED_TAPE,  4).print_area ());
  BOOST_CHECK (media::area (48,  32)
               == *media (media::LAMINATED_TAPE,  6).print_area ());
  BOOST_CHECK (media::area (39,  50)
               == *media (media::LAMINATED_TAPE,  9).print_area ());
  BOOST_CHECK (media::area (29,  70)
               == *media (media::LAMINATED_TAPE, 12).print_area ());
  BOOST_CHECK (media::area ( 8, 112)
               == *media (media::LAMINATED_TAPE, 18).print_area ());
  BOOST_CHECK (media::area ( 0, 128)
               == *media (media::LAMINATED_TAPE, 24).print_area ());
}

BOOST_AUTO_TEST_CASE (tube_print_areas)
{
  BOOST_CHECK (media::area (50,  28)
               == *media (media::HEAT_SHRINK_TUBE,  6).print_area ());
  BOOST_CHECK (media::area (31,  66)
               == *media (media::HEAT_SHRINK_TUBE, 12).print_area ());
  BOOST_CHECK (media::area ( 0, 128)
               == *media (media::HEAT_SHRINK_TUBE, 24).print_area ());
}

BOOST_AUTO_TEST_CASE (no_print_area_for_odd_widths)
{
  BOOST_CHECK (!media (media::LAMINATED_TAPE, 36).print_area ());
  BOOST_CHECK (!media (media::NO_MEDIA, 0).print_area ());
}

BOOST_AUTO_TEST_CASE (string_representation)
{
  BOOST_CHECK_EQUAL (std::string ("12mm laminated tape"),
                     media (media::LAMINATED_TAPE, 12).str ());
  BOOST_CHECK_EQUAL (std::string ("12mm die-cut label (29mm)"),
                     media (media::DIE_CUT_LABEL, 12, 29).str ());
}

BOOST_AUTO_TEST_CASE (model_lookup)
{
  const model *m = model::find ("PT-P750W");

  BOOST_REQUIRE (m);
  BOOST_CHECK_EQUAL (0x2062, m->product_id);
  BOOST_CHECK_EQUAL (16, m->line_bytes ());
  BOOST_CHECK_EQUAL (180, m->dpi);
  BOOST_CHECK_EQUAL (m, model::find (uint16_t (0x2062)));

  BOOST_CHECK (!model::find ("ql-800"));
  BOOST_CHECK (!model::find (uint16_t (0x0000)));
  BOOST_CHECK_EQUAL (3, model::names ().size ());
}

#include "ptouch/test/runner.ipp"
