//  hexdump.cpp -- log connexion transmissions
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

#include <iomanip>
#include <locale>
#include <sstream>

#include "ptouch/log.hpp"

#include "hexdump.hpp"

namespace ptouch {
namespace _cnx_ {

using namespace std;

hexdump::hexdump (connexion::ptr instance)
  : base_(instance)
{
  if (log::DEBUG > log::threshold) log::threshold = log::DEBUG;
}

void
hexdump::send (const octet *message, streamsize size)
{
  hexdump_(message, size, ">>");
  instance_->send (message, size);
}

void
hexdump::send (const octet *message, streamsize size, double timeout)
{
  hexdump_(message, size, ">>");
  instance_->send (message, size, timeout);
}

streamsize
hexdump::recv (octet *message, streamsize size)
{
  streamsize n = instance_->recv (message, size);
  hexdump_(message, n, "<<");
  return n;
}

streamsize
hexdump::recv (octet *message, streamsize size, double timeout)
{
  streamsize n = instance_->recv (message, size, timeout);
  hexdump_(message, n, "<<");
  return n;
}

void
hexdump::hexdump_(const octet *buf, streamsize sz, const std::string& io)
{
  if (log::DEBUG > log::threshold) return;

  vector< string > lines (format_lines (buf, sz, io));
  for (vector< string >::const_iterator it = lines.begin ();
       lines.end () != it; ++it)
    {
      log::debug ("%1%") % *it;
    }
}

vector< string >
hexdump::format_lines (const octet *buf, streamsize sz, const string& io)
{
  const streamsize quad_length = 4;
  const streamsize quad_count  = 4;
  const streamsize line_length = quad_length * quad_count;

  vector< string > rv;

  streamsize i = 0;
  while (i < sz)
    {
      stringstream asc_dump;
      stringstream hex_dump;

      asc_dump.imbue (locale::classic ());
      hex_dump.imbue (locale::classic ());
      hex_dump.fill ('0');

      streamsize offset = i;
      streamsize j = 0;
      while (i < sz && j < line_length)
        {
          traits::char_type c = buf[i];
          asc_dump << (isprint (c, locale::classic ()) ? c : '.');
          hex_dump << " " << setw (2) << hex << traits::to_int_type (buf[i]);
          ++i, ++j;
          if (0 == j % quad_length && j != line_length)
            hex_dump << " ";
        }
      while (0 != j % line_length)
        {
          asc_dump << " ";
          hex_dump << "   ";
          ++j;
          if (0 == j % quad_length && j != line_length)
            hex_dump << " ";
        }

      ostringstream os;
      os << setw (8) << setfill ('0') << hex << offset
         << io << " " << hex_dump.str ()
         << "  |" << asc_dump.str () << "|";
      rv.push_back (os.str ());
    }
  return rv;
}

}       // namespace _cnx_
}       // namespace ptouch
