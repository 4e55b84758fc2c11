//  media.cpp -- tape and label media loaded in a printer
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

#include <map>
#include <sstream>

#include <boost/assign/list_of.hpp>

#include "ptouch/log.hpp"

#include "media.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

namespace {

  typedef std::map< byte, media::kind_type > kind_dictionary;
  typedef std::map< uint16_t, media::area > area_dictionary;

  // Keyed on the width byte of the status reply.  Tapes of 3.5mm are
  // reported as 4mm wide and heat-shrink tubes by their nominal size.

  const area_dictionary tape_areas = boost::assign::map_list_of
    ( 4, media::area (52,  24))
    ( 6, media::area (48,  32))
    ( 9, media::area (39,  50))
    (12, media::area (29,  70))
    (18, media::area ( 8, 112))
    (24, media::area ( 0, 128))
    ;

  const area_dictionary tube_areas = boost::assign::map_list_of
    ( 6, media::area (50,  28))
    ( 9, media::area (40,  48))
    (12, media::area (31,  66))
    (18, media::area (11, 106))
    (24, media::area ( 0, 128))
    ;

  // The PT series reports its tapes as 0x01, 0x03 and 0x11.  The
  // continuous (0x0a) and die-cut (0x0b) codes are only reported by
  // the QL series.

  const kind_dictionary kinds = boost::assign::map_list_of
    (0x00, media::NO_MEDIA)
    (0x01, media::LAMINATED_TAPE)
    (0x03, media::NON_LAMINATED_TAPE)
    (0x0a, media::CONTINUOUS_TAPE)
    (0x0b, media::DIE_CUT_LABEL)
    (0x11, media::HEAT_SHRINK_TUBE)
    (0xff, media::INCOMPATIBLE)
    ;

//! P-touch tapes are continuous media too
bool
is_tape_(media::kind_type kind)
{
  return (media::LAMINATED_TAPE == kind
          || media::NON_LAMINATED_TAPE == kind
          || media::CONTINUOUS_TAPE == kind);
}

}       // namespace

media::media (kind_type kind, uint16_t width_mm, uint16_t length_mm)
  : kind_(kind)
  , width_(width_mm)
  , length_(length_mm)
{}

media
media::from_status (byte kind, byte width, byte length)
{
  kind_dictionary::const_iterator it = kinds.find (kind);

  kind_type k = UNKNOWN;
  if (kinds.end () != it)
    k = it->second;
  else
    log::brief ("unknown media identifier: %1$#04x")
      % traits::to_int_type (kind);

  return media (k, traits::to_int_type (width), traits::to_int_type (length));
}

byte
media::kind_code () const
{
  for (kind_dictionary::const_iterator it = kinds.begin ();
       kinds.end () != it; ++it)
    {
      if (it->second == kind_) return it->first;
    }
  return 0x00;
}

bool
media::is_compatible (const boost::optional< media >& hint) const
{
  if (!hint) return true;

  if (hint->width_ && hint->width_ != width_)
    return false;
  if (UNKNOWN != hint->kind_ && hint->kind_ != kind_
      && !(CONTINUOUS_TAPE == hint->kind_ && is_tape_(kind_)))
    return false;
  if (DIE_CUT_LABEL == kind_ && hint->length_ && hint->length_ != length_)
    return false;

  return true;
}

boost::optional< media::area >
media::print_area () const
{
  const area_dictionary& dict = (HEAT_SHRINK_TUBE == kind_
                                 ? tube_areas
                                 : tape_areas);

  area_dictionary::const_iterator it = dict.find (width_);
  if (dict.end () == it) return boost::none;

  return it->second;
}

bool
media::operator== (const media& that) const
{
  return (kind_   == that.kind_
          && width_  == that.width_
          && length_ == that.length_);
}

const char *
media::name (kind_type kind)
{
  switch (kind)
    {
    case UNKNOWN:            return "unknown";
    case NO_MEDIA:           return "no media";
    case LAMINATED_TAPE:     return "laminated tape";
    case NON_LAMINATED_TAPE: return "non-laminated tape";
    case HEAT_SHRINK_TUBE:   return "heat-shrink tube";
    case CONTINUOUS_TAPE:    return "continuous tape";
    case DIE_CUT_LABEL:      return "die-cut label";
    case INCOMPATIBLE:       return "incompatible";
    }
  return "unknown";
}

std::string
media::str () const
{
  std::ostringstream os;
  os << width_ << "mm " << name (kind_);
  if (length_) os << " (" << length_ << "mm)";
  return os.str ();
}

std::ostream&
operator<< (std::ostream& os, const media& m)
{
  return os << m.str ();
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
