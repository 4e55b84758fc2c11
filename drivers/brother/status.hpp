//  status.hpp -- decoded status information replies
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

#ifndef drivers_brother_status_hpp_
#define drivers_brother_status_hpp_

#include <string>

#include "buffer.hpp"
#include "media.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Error information bits of a status reply
/*! The low byte comes from error information 1 (offset 8), the high
 *  byte from error information 2 (offset 9).
 */
namespace error_flag {

  const uint16_t NO_MEDIA                  = 0x0001;
  const uint16_t END_OF_MEDIA              = 0x0002;
  const uint16_t CUTTER_JAM                = 0x0004;
  const uint16_t WEAK_BATTERIES            = 0x0008;
  const uint16_t PRINTER_IN_USE            = 0x0010;
  const uint16_t PRINTER_TURNED_OFF        = 0x0020;
  const uint16_t HIGH_VOLTAGE_ADAPTER      = 0x0040;
  const uint16_t FAN_MOTOR                 = 0x0080;
  const uint16_t REPLACE_MEDIA             = 0x0100;
  const uint16_t EXPANSION_BUFFER_FULL     = 0x0200;
  const uint16_t COMMUNICATION_ERROR       = 0x0400;
  const uint16_t COMMUNICATION_BUFFER_FULL = 0x0800;
  const uint16_t COVER_OPEN                = 0x1000;
  const uint16_t OVERHEATING               = 0x2000;
  const uint16_t BLACK_MARKING             = 0x4000;
  const uint16_t SYSTEM_ERROR              = 0x8000;

  //! Comma separated names of all bits set in \a flags
  std::string describe (uint16_t flags);

}       // namespace error_flag

//! The 32 byte reply to a status information request
/*! The printers send one of these in reply to a status_request and
 *  on their own accord while printing (when status notification has
 *  not been turned off).  Instances can only be obtained through the
 *  decode() function, which validates the frame before any of the
 *  fields are looked at.
 */
class status
{
public:
  static const streamsize size = 32;

  enum status_type {
    REPLY          = 0x00,
    COMPLETED      = 0x01,
    ERROR_OCCURRED = 0x02,
    EXIT_IF        = 0x03,
    TURNED_OFF     = 0x04,
    NOTIFICATION   = 0x05,
    PHASE_CHANGE   = 0x06,
    UNKNOWN_TYPE   = 0xff,
  };

  enum phase_type {
    RECEIVING = 0x00,
    PRINTING  = 0x01,
  };

  enum notification_type {
    NOT_AVAILABLE = 0x00,
    COVER_OPENED  = 0x01,
    COVER_CLOSED  = 0x02,
  };

  //! Turns \a sz bytes at \a frame into a status
  /*! Throws a decode_error with reason BAD_LENGTH when \a sz is not
   *  exactly status::size and with BAD_SIGNATURE when the fixed bytes
   *  at the start of the frame are off.
   */
  static status decode (const byte *frame, streamsize sz);
  static status decode (const byte_buffer& frame);

  uint16_t error_flags () const;
  bool has_error () const { return error_flags (); }

  brother::media media () const;

  //! Various mode settings in effect, as in set_various_mode
  byte mode () const;

  status_type type () const;
  phase_type phase () const;
  uint16_t phase_number () const;
  notification_type notification () const;

  byte model_code () const;
  byte tape_colour () const;
  byte text_colour () const;

  const byte_buffer& raw () const { return raw_; }

  static const char * name (status_type type);

  //! Names the tape and text colour codes of a reply
  static const char * colour_name (byte code);

private:
  explicit status (const byte_buffer& raw);

  byte_buffer raw_;
};

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_status_hpp_ */
