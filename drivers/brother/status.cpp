//  status.cpp -- decoded status information replies
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

#include <boost/throw_exception.hpp>

#include "ptouch/log.hpp"

#include "exception.hpp"
#include "status.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

namespace {

  // Fixed header bytes: print head mark, frame size, Brother code and
  // series code.
  const byte signature[] = { byte (0x80), 0x20, 0x42, 0x30 };

  const int print_head_mark = 0;
  const int model           = 4;
  const int error_info_1    = 8;
  const int error_info_2    = 9;
  const int media_width     = 10;
  const int media_kind      = 11;
  const int mode_setting    = 15;
  const int media_length    = 17;
  const int status_kind     = 18;
  const int phase_kind      = 19;
  const int phase_number_hi = 20;
  const int phase_number_lo = 21;
  const int notification_no = 22;
  const int tape_colour_no  = 24;
  const int text_colour_no  = 25;

  uint16_t
  to_uint16_t (const byte_buffer& buf, int offset)
  {
    return traits::to_int_type (buf[offset]);
  }

  struct flag_name
  {
    uint16_t    flag;
    const char *name;
  };

  const flag_name flag_names[] = {
    { error_flag::NO_MEDIA                 , "no media" },
    { error_flag::END_OF_MEDIA             , "end of media" },
    { error_flag::CUTTER_JAM               , "cutter jam" },
    { error_flag::WEAK_BATTERIES           , "weak batteries" },
    { error_flag::PRINTER_IN_USE           , "printer in use" },
    { error_flag::PRINTER_TURNED_OFF       , "printer turned off" },
    { error_flag::HIGH_VOLTAGE_ADAPTER     , "high-voltage adapter" },
    { error_flag::FAN_MOTOR                , "fan motor error" },
    { error_flag::REPLACE_MEDIA            , "replace media" },
    { error_flag::EXPANSION_BUFFER_FULL    , "expansion buffer full" },
    { error_flag::COMMUNICATION_ERROR      , "communication error" },
    { error_flag::COMMUNICATION_BUFFER_FULL, "communication buffer full" },
    { error_flag::COVER_OPEN               , "cover open" },
    { error_flag::OVERHEATING              , "overheating" },
    { error_flag::BLACK_MARKING            , "black marking not detected" },
    { error_flag::SYSTEM_ERROR             , "system error" },
  };

}       // namespace

std::string
error_flag::describe (uint16_t flags)
{
  std::string rv;

  for (size_t i = 0; i < sizeof (flag_names) / sizeof (*flag_names); ++i)
    {
      if (!(flags & flag_names[i].flag)) continue;

      if (!rv.empty ()) rv += ", ";
      rv += flag_names[i].name;
    }
  return rv;
}

const streamsize status::size;

status::status (const byte_buffer& raw)
  : raw_(raw)
{}

status
status::decode (const byte *frame, streamsize sz)
{
  if (size != sz || !frame)
    BOOST_THROW_EXCEPTION
      (decode_error (decode_error::BAD_LENGTH,
                     (format ("status reply of %1% bytes, expected %2%")
                      % sz % size).str ()));

  for (size_t i = 0; i < sizeof (signature); ++i)
    {
      if (signature[i] != frame[print_head_mark + i])
        BOOST_THROW_EXCEPTION
          (decode_error (decode_error::BAD_SIGNATURE,
                         (format ("unexpected byte %1$#04x at offset %2%")
                          % traits::to_int_type (frame[i]) % i).str ()));
    }

  return status (byte_buffer (frame, size));
}

status
status::decode (const byte_buffer& frame)
{
  return decode (frame.data (), frame.size ());
}

uint16_t
status::error_flags () const
{
  return (to_uint16_t (raw_, error_info_1)
          | to_uint16_t (raw_, error_info_2) << 8);
}

brother::media
status::media () const
{
  return brother::media::from_status (raw_[media_kind], raw_[media_width],
                                      raw_[media_length]);
}

byte
status::mode () const
{
  return raw_[mode_setting];
}

status::status_type
status::type () const
{
  uint16_t t = to_uint16_t (raw_, status_kind);

  if (PHASE_CHANGE < t)
    {
      log::brief ("unknown status type: %1$#04x") % t;
      return UNKNOWN_TYPE;
    }
  return static_cast< status_type > (t);
}

status::phase_type
status::phase () const
{
  return (to_uint16_t (raw_, phase_kind)
          ? PRINTING
          : RECEIVING);
}

uint16_t
status::phase_number () const
{
  return (to_uint16_t (raw_, phase_number_hi) << 8
          | to_uint16_t (raw_, phase_number_lo));
}

status::notification_type
status::notification () const
{
  switch (to_uint16_t (raw_, notification_no))
    {
    case COVER_OPENED: return COVER_OPENED;
    case COVER_CLOSED: return COVER_CLOSED;
    }
  return NOT_AVAILABLE;
}

byte
status::model_code () const
{
  return raw_[model];
}

byte
status::tape_colour () const
{
  return raw_[tape_colour_no];
}

byte
status::text_colour () const
{
  return raw_[text_colour_no];
}

const char *
status::name (status_type type)
{
  switch (type)
    {
    case REPLY:          return "reply";
    case COMPLETED:      return "printing completed";
    case ERROR_OCCURRED: return "error occurred";
    case EXIT_IF:        return "exit";
    case TURNED_OFF:     return "turned off";
    case NOTIFICATION:   return "notification";
    case PHASE_CHANGE:   return "phase change";
    case UNKNOWN_TYPE:   break;
    }
  return "unknown";
}

const char *
status::colour_name (byte code)
{
  switch (traits::to_int_type (code))
    {
    case 0x01: return "white";
    case 0x02: return "other";
    case 0x03: return "clear";
    case 0x04: return "red";
    case 0x05: return "blue";
    case 0x06: return "yellow";
    case 0x07: return "green";
    case 0x08: return "black";
    case 0x09: return "clear (white text)";
    case 0x0a: return "gold";
    case 0x62: return "blue (F)";
    case 0xf0: return "cleaning";
    case 0xf1: return "stencil";
    case 0xff: return "incompatible";
    }
  return "unknown";
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
