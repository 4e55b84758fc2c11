//  command.hpp -- raster protocol commands and their encoding
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

#ifndef drivers_brother_command_hpp_
#define drivers_brother_command_hpp_

#include <boost/variant.hpp>

#include "buffer.hpp"
#include "media.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Flags for the set_various_mode command
namespace various_mode {

  const byte AUTO_CUT = 0x40;
  const byte MIRROR   = 0x80;

}       // namespace various_mode

//! Flags for the set_advanced_mode command
namespace advanced_mode {

  const byte HALF_CUT        = 0x04;
  const byte NO_CHAIN        = 0x08;
  const byte SPECIAL_TAPE    = 0x10;
  const byte HIGH_RESOLUTION = 0x40;
  const byte NO_BUFFER_CLEAR = 0x80;

}       // namespace advanced_mode

//! Switches the printer to the next command without waiting
/*! Sends enough NUL bytes to flush out whatever half-finished command
 *  the printer may still be waiting on.
 */
struct invalidate
{
  static const streamsize size = 200;
};

//! Resets the print settings and clears the print buffer
struct initialize {};

//! Asks for a status reply
struct status_request {};

struct switch_mode
{
  enum mode_type {
    ESC_P    = 0x00,
    RASTER   = 0x01,
    TEMPLATE = 0x03,
  };

  mode_type mode;

  switch_mode (mode_type m = RASTER) : mode (m) {}
};

//! Turns unsolicited status replies on or off
struct set_status_notify
{
  bool notify;

  set_status_notify (bool on = true) : notify (on) {}
};

//! Print information, the \c ESC \c i \c z command
/*! Only the fields that have been set are flagged as valid.  The
 *  printer checks those against the loaded media and refuses to print
 *  when they do not match.
 */
struct set_media_and_quality
{
  enum page_type {
    FIRST_PAGE = 0x00,
    OTHER_PAGE = 0x01,
    LAST_PAGE  = 0x02,
  };

  boost::optional< byte >     kind;
  boost::optional< uint8_t >  width_mm;
  boost::optional< uint8_t >  length_mm;
  bool      quality;            //!< give priority to print quality
  bool      recover;
  uint32_t  raster_count;
  page_type page;

  set_media_and_quality ()
    : quality (false), recover (true), raster_count (0), page (FIRST_PAGE)
  {}

  //! Describes \a m for a job segment of \a lines raster lines
  set_media_and_quality (const media& m, uint32_t lines, page_type pg);
};

struct set_various_mode
{
  byte flags;

  set_various_mode (byte f = 0) : flags (f) {}
};

struct set_advanced_mode
{
  byte flags;

  set_advanced_mode (byte f = 0) : flags (f) {}
};

//! Sets the amount of feed before and after printing, in dots
struct set_margin
{
  uint16_t dots;

  set_margin (uint16_t n = 0) : dots (n) {}
};

//! Cuts after every \a labels labels when auto cut is on
struct set_cut_every
{
  uint8_t labels;

  set_cut_every (uint8_t n = 1) : labels (n) {}
};

//! Selects PackBits compressed or plain raster transfers
struct set_compression
{
  bool enabled;

  set_compression (bool on = true) : enabled (on) {}
};

//! Transfers a single raster line
/*! Lines with nothing to print go out as a single zero raster byte.
 *  When \a compressed is set the line data is PackBits encoded.  The
 *  printer needs to have been told with set_compression.
 */
struct raster_transfer
{
  raster_line line;
  bool        compressed;

  raster_transfer (const raster_line& l = raster_line (), bool c = false)
    : line (l), compressed (c)
  {}
};

//! Prints the buffered lines, without feeding, for non-final segments
struct print_no_feed {};

//! Prints the buffered lines and ejects the media
struct print_and_feed {};

typedef boost::variant< invalidate
                        , initialize
                        , status_request
                        , switch_mode
                        , set_status_notify
                        , set_media_and_quality
                        , set_various_mode
                        , set_advanced_mode
                        , set_margin
                        , set_cut_every
                        , set_compression
                        , raster_transfer
                        , print_no_feed
                        , print_and_feed
                        > command;

//! Bytes the printer expects for a \a cmd
byte_buffer encode (const command& cmd);

//! Short human readable name of a \a cmd, for logging
const char * name (const command& cmd);

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_command_hpp_ */
