//  command.cpp -- raster protocol commands and their encoding
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

#include "command.hpp"
#include "compression.hpp"
#include "exception.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

namespace {

  const byte print_info_kind    = 0x02;
  const byte print_info_width   = 0x04;
  const byte print_info_length  = 0x08;
  const byte print_info_quality = 0x40;
  const byte print_info_recover = 0x80;

  const byte compression_none = 0x00;
  const byte compression_tiff = 0x02;

  void
  from_uint16_t (byte_buffer& buf, uint16_t value)
  {
    buf.push_back (0xff & value);
    buf.push_back (0xff & (value >> 8));
  }

  void
  from_uint32_t (byte_buffer& buf, uint32_t value)
  {
    from_uint16_t (buf, 0xffff & value);
    from_uint16_t (buf, 0xffff & (value >> 16));
  }

  byte_buffer
  extended (byte name)
  {
    byte_buffer rv;
    rv.push_back (ESC);
    rv.push_back (LOWER_I);
    rv.push_back (name);
    return rv;
  }

  bool
  is_blank (const raster_line& line)
  {
    for (raster_line::const_iterator it = line.begin ();
         line.end () != it; ++it)
      {
        if (NUL != *it) return false;
      }
    return true;
  }

  class encoder
    : public boost::static_visitor< byte_buffer >
  {
  public:
    byte_buffer operator() (const invalidate&) const
    {
      return byte_buffer (invalidate::size, NUL);
    }

    byte_buffer operator() (const initialize&) const
    {
      byte_buffer rv;
      rv.push_back (ESC);
      rv.push_back (AT_MARK);
      return rv;
    }

    byte_buffer operator() (const status_request&) const
    {
      return extended (UPPER_S);
    }

    byte_buffer operator() (const switch_mode& cmd) const
    {
      byte_buffer rv (extended (LOWER_A));
      rv.push_back (cmd.mode);
      return rv;
    }

    byte_buffer operator() (const set_status_notify& cmd) const
    {
      byte_buffer rv (extended (EXCLAM));
      rv.push_back (cmd.notify ? 0x00 : 0x01);
      return rv;
    }

    byte_buffer operator() (const set_media_and_quality& cmd) const
    {
      byte flags = 0x00;
      if (cmd.kind)      flags |= print_info_kind;
      if (cmd.width_mm)  flags |= print_info_width;
      if (cmd.length_mm) flags |= print_info_length;
      if (cmd.quality)   flags |= print_info_quality;
      if (cmd.recover)   flags |= print_info_recover;

      byte_buffer rv (extended (LOWER_Z));
      rv.push_back (flags);
      rv.push_back (cmd.kind ? *cmd.kind : 0x00);
      rv.push_back (cmd.width_mm ? *cmd.width_mm : 0x00);
      rv.push_back (cmd.length_mm ? *cmd.length_mm : 0x00);
      from_uint32_t (rv, cmd.raster_count);
      rv.push_back (cmd.page);
      rv.push_back (0x00);
      return rv;
    }

    byte_buffer operator() (const set_various_mode& cmd) const
    {
      byte_buffer rv (extended (UPPER_M));
      rv.push_back (cmd.flags);
      return rv;
    }

    byte_buffer operator() (const set_advanced_mode& cmd) const
    {
      byte_buffer rv (extended (UPPER_K));
      rv.push_back (cmd.flags);
      return rv;
    }

    byte_buffer operator() (const set_margin& cmd) const
    {
      byte_buffer rv (extended (LOWER_D));
      from_uint16_t (rv, cmd.dots);
      return rv;
    }

    byte_buffer operator() (const set_cut_every& cmd) const
    {
      byte_buffer rv (extended (UPPER_A));
      rv.push_back (cmd.labels);
      return rv;
    }

    byte_buffer operator() (const set_compression& cmd) const
    {
      byte_buffer rv;
      rv.push_back (UPPER_M);
      rv.push_back (cmd.enabled ? compression_tiff : compression_none);
      return rv;
    }

    byte_buffer operator() (const raster_transfer& cmd) const
    {
      byte_buffer rv;

      if (is_blank (cmd.line))
        {
          rv.push_back (UPPER_Z);
          return rv;
        }

      byte_buffer data (cmd.compressed ? pack_bits (cmd.line) : cmd.line);

      if (0xffff < data.size ())
        BOOST_THROW_EXCEPTION
          (invalid_argument ("raster line too long"));

      rv.reserve (3 + data.size ());
      rv.push_back (UPPER_G);
      from_uint16_t (rv, data.size ());
      rv += data;
      return rv;
    }

    byte_buffer operator() (const print_no_feed&) const
    {
      return byte_buffer (1, FF);
    }

    byte_buffer operator() (const print_and_feed&) const
    {
      return byte_buffer (1, SUB);
    }
  };

  class namer
    : public boost::static_visitor< const char * >
  {
  public:
    const char * operator() (const invalidate&) const
    { return "invalidate"; }
    const char * operator() (const initialize&) const
    { return "initialize"; }
    const char * operator() (const status_request&) const
    { return "status request"; }
    const char * operator() (const switch_mode&) const
    { return "switch mode"; }
    const char * operator() (const set_status_notify&) const
    { return "set status notify"; }
    const char * operator() (const set_media_and_quality&) const
    { return "set media and quality"; }
    const char * operator() (const set_various_mode&) const
    { return "set various mode"; }
    const char * operator() (const set_advanced_mode&) const
    { return "set advanced mode"; }
    const char * operator() (const set_margin&) const
    { return "set margin"; }
    const char * operator() (const set_cut_every&) const
    { return "set cut every"; }
    const char * operator() (const set_compression&) const
    { return "set compression"; }
    const char * operator() (const raster_transfer&) const
    { return "raster transfer"; }
    const char * operator() (const print_no_feed&) const
    { return "print"; }
    const char * operator() (const print_and_feed&) const
    { return "print and feed"; }
  };

}       // namespace

const streamsize invalidate::size;

set_media_and_quality::set_media_and_quality (const media& m,
                                              uint32_t lines,
                                              page_type pg)
  : quality (false), recover (true), raster_count (lines), page (pg)
{
  if (media::UNKNOWN != m.kind ())
    kind = m.kind_code ();
  if (m.width_mm ())
    width_mm = static_cast< uint8_t > (m.width_mm ());
  if (m.length_mm ())
    length_mm = static_cast< uint8_t > (m.length_mm ());
}

byte_buffer
encode (const command& cmd)
{
  return boost::apply_visitor (encoder (), cmd);
}

const char *
name (const command& cmd)
{
  return boost::apply_visitor (namer (), cmd);
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
