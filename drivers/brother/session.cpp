//  session.cpp -- drive a print job through a printer
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

#include <cerrno>
#include <time.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/throw_exception.hpp>

#include "ptouch/log.hpp"

#include "exception.hpp"
#include "session.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

using boost::posix_time::microsec_clock;
using boost::posix_time::microseconds;
using boost::posix_time::ptime;

session::session (connexion::ptr cnx, const options& opts)
  : cnx_(cnx)
  , opts_(opts)
  , state_(DISCONNECTED)
  , cancelled_(false)
{
  if (!cnx_)
    BOOST_THROW_EXCEPTION (invalid_argument ("no connexion"));
  if (0 == opts_.write_attempts)
    BOOST_THROW_EXCEPTION
      (invalid_argument ("write attempts must be at least one"));
}

session::state_type
session::print (const job& j)
{
  if (DISCONNECTED != state_)
    BOOST_THROW_EXCEPTION
      (logic_error ((format ("session already %1%") % name (state_)).str ()));

  if (j.lines ().empty ())
    BOOST_THROW_EXCEPTION (invalid_argument ("nothing to print"));
  if (0 == j.options ().copies)
    BOOST_THROW_EXCEPTION (invalid_argument ("zero copies requested"));

  for (size_t i = 0; i < j.lines ().size (); ++i)
    {
      streamsize sz = j.lines ()[i].size ();
      if (opts_.line_bytes != sz)
        BOOST_THROW_EXCEPTION
          (invalid_argument
           ((format ("raster line %1% has %2% bytes, expected %3%")
             % i % sz % opts_.line_bytes).str ()));
    }

  if (!send_(invalidate ())) return state_;
  transition_(INVALIDATED);

  if (!send_(initialize ())) return state_;
  transition_(INITIALIZED);

  boost::optional< status > st;
  if (!request_status_(st)) return state_;

  media_ = st->media ();
  log::brief ("printer reports %1%") % *media_;

  if (st->has_error ())
    return fail_(fault_info::DEVICE,
                 error_flag::describe (st->error_flags ()),
                 st->error_flags ());

  if (media::INCOMPATIBLE == media_->kind ()
      || !media_->is_compatible (j.hint ()))
    {
      return fail_(fault_info::MEDIA_MISMATCH,
                   (format ("job expects %1%, printer has %2%")
                    % (j.hint () ? j.hint ()->str () : "any media")
                    % *media_).str ());
    }
  transition_(MEDIA_CONFIGURED);

  if (!stream_(j)) return state_;

  await_completion_();
  return state_;
}

status
session::query ()
{
  const command prologue[] = {
    invalidate (),
    initialize (),
    status_request (),
  };

  for (size_t i = 0; i < sizeof (prologue) / sizeof (*prologue); ++i)
    {
      byte_buffer buf (encode (prologue[i]));
      cnx_->send (buf.data (), buf.size (), opts_.write_timeout);
    }
  return recv_status_(opts_.status_timeout);
}

void
session::cancel ()
{
  std::lock_guard< std::mutex > lock (mutex_);
  cancelled_ = true;
}

session::state_type
session::state () const
{
  return state_;
}

const session::fault_info&
session::fault () const
{
  return fault_;
}

const boost::optional< media >&
session::reported_media () const
{
  return media_;
}

connection
session::connect_state (const state_signal_type::slot_type& slot)
{
  return signal_state_.connect (slot);
}

connection
session::connect_update (const update_signal_type::slot_type& slot)
{
  return signal_update_.connect (slot);
}

const char *
session::name (state_type state)
{
  switch (state)
    {
    case DISCONNECTED:        return "disconnected";
    case INVALIDATED:         return "invalidated";
    case INITIALIZED:         return "initialized";
    case MEDIA_CONFIGURED:    return "media configured";
    case STREAMING:           return "streaming";
    case FINALIZING:          return "finalizing";
    case AWAITING_COMPLETION: return "awaiting completion";
    case COMPLETED:           return "completed";
    case FAULTED:             return "faulted";
    }
  return "unknown";
}

//! Writes \a cmd, trying up to write_attempts times
/*! Returns \c false after faulting the session when all attempts
 *  failed.  Every attempt sends exactly the same bytes.
 */
bool
session::send_(const command& cmd)
{
  const byte_buffer buf (encode (cmd));

  for (unsigned attempt = 1;; ++attempt)
    {
      try
        {
          cnx_->send (buf.data (), buf.size (), opts_.write_timeout);
          return true;
        }
      catch (const io_error& e)
        {
          if (opts_.write_attempts <= attempt)
            {
              fail_(fault_info::TRANSPORT,
                    (format ("%1%: %2% (after %3% attempts)")
                     % brother::name (cmd) % e.what () % attempt).str ());
              return false;
            }
          log::alert ("%1%: %2%, retrying (%3%/%4%)")
            % brother::name (cmd) % e.what ()
            % (attempt + 1) % opts_.write_attempts;
        }
    }
}

status
session::recv_status_(double timeout)
{
  // Room for more than one frame so oversized replies get noticed
  byte buf[2 * status::size];

  streamsize n = cnx_->recv (buf, sizeof (buf), timeout);
  return status::decode (buf, n);
}

bool
session::request_status_(boost::optional< status >& st)
{
  for (unsigned attempt = 1;; ++attempt)
    {
      if (!send_(status_request ())) return false;

      try
        {
          st = recv_status_(opts_.status_timeout);
          return true;
        }
      catch (const timeout_error& e)
        {
          fail_(fault_info::TIMEOUT,
                (format ("no status reply: %1%") % e.what ()).str ());
          return false;
        }
      catch (const decode_error& e)
        {
          fail_(fault_info::DECODE, e.what ());
          return false;
        }
      catch (const io_error& e)
        {
          if (opts_.write_attempts <= attempt)
            {
              fail_(fault_info::TRANSPORT, e.what ());
              return false;
            }
          log::alert ("status read: %1%, retrying") % e.what ();
        }
    }
}

bool
session::stream_(const job& j)
{
  const job::options_type& o (j.options ());
  const std::vector< raster_line >& lines (j.lines ());
  const streamsize total = lines.size () * o.copies;
  streamsize written = 0;

  byte various = 0;
  if (o.auto_cut) various |= various_mode::AUTO_CUT;
  if (o.mirror)   various |= various_mode::MIRROR;

  byte advanced = 0;
  if (o.half_cut)         advanced |= advanced_mode::HALF_CUT;
  if (!o.chain_printing)  advanced |= advanced_mode::NO_CHAIN;
  if (o.high_resolution)  advanced |= advanced_mode::HIGH_RESOLUTION;

  if (!send_(switch_mode (switch_mode::RASTER))) return false;

  for (uint16_t copy = 0; copy < o.copies; ++copy)
    {
      const bool last = (copy + 1 == o.copies);
      set_media_and_quality::page_type page
        = (0 == copy ? set_media_and_quality::FIRST_PAGE
           : (last   ? set_media_and_quality::LAST_PAGE
              :        set_media_and_quality::OTHER_PAGE));

      if (!send_(set_media_and_quality (*media_, lines.size (), page))
          || !send_(set_various_mode (various))
          || !send_(set_advanced_mode (advanced))
          || !send_(set_margin (o.margin_dots)))
        return false;

      if (o.auto_cut && 1 < o.cut_every
          && !send_(set_cut_every (o.cut_every)))
        return false;

      if (0 == copy && o.compress
          && !send_(set_compression (true)))
        return false;

      for (std::vector< raster_line >::const_iterator it = lines.begin ();
           lines.end () != it; ++it)
        {
          if (cancel_requested_())
            {
              fail_(fault_info::CANCELLED,
                    (format ("cancelled after %1% of %2% lines")
                     % written % total).str ());
              return false;
            }
          if (STREAMING != state_) transition_(STREAMING);

          if (!send_(raster_transfer (*it, o.compress))) return false;

          ++written;
          signal_update_(written, total);
        }

      if (last)
        {
          transition_(FINALIZING);
          if (!send_(print_and_feed ())) return false;
        }
      else
        {
          if (!send_(print_no_feed ())) return false;
        }
    }
  return true;
}

//! Polls the printer until it is done with the job
/*! Read timeouts and undecodable replies are expected while a printer
 *  is busy and merely lead to another poll.
 */
void
session::await_completion_()
{
  transition_(AWAITING_COMPLETION);

  const ptime deadline = (microsec_clock::universal_time ()
                          + microseconds (static_cast< long >
                                         (opts_.completion_timeout * 1e6)));
  unsigned io_failures = 0;

  while (true)
    {
      if (!send_(status_request ())) return;

      try
        {
          status st (recv_status_(opts_.status_timeout));

          if (st.has_error ()
              || status::ERROR_OCCURRED == st.type ()
              || status::TURNED_OFF == st.type ())
            {
              std::string what (error_flag::describe (st.error_flags ()));
              fail_(fault_info::DEVICE,
                    (format ("%1%%2%%3%")
                     % status::name (st.type ())
                     % (what.empty () ? "" : ": ")
                     % what).str (),
                    st.error_flags ());
              return;
            }

          switch (st.type ())
            {
            case status::COMPLETED:
              transition_(COMPLETED);
              return;
            case status::NOTIFICATION:
              log::brief ("notification: cover %1%")
                % (status::COVER_OPENED == st.notification ()
                   ? "opened" : "closed");
              break;
            case status::PHASE_CHANGE:
              log::trace ("phase change: %1% (%2%)")
                % (status::PRINTING == st.phase ()
                   ? "printing" : "receiving")
                % st.phase_number ();
              break;
            default:
              log::trace ("%1% while awaiting completion")
                % status::name (st.type ());
            }
        }
      catch (const timeout_error&)
        {
          log::trace ("no status reply yet");
        }
      catch (const decode_error& e)
        {
          log::trace ("ignoring status reply: %1%") % e.what ();
        }
      catch (const io_error& e)
        {
          if (opts_.write_attempts <= ++io_failures)
            {
              fail_(fault_info::TRANSPORT, e.what ());
              return;
            }
          log::alert ("status read: %1%, retrying") % e.what ();
        }

      if (deadline <= microsec_clock::universal_time ())
        {
          fail_(fault_info::TIMEOUT,
                (format ("printing did not complete within %1% seconds")
                 % opts_.completion_timeout).str ());
          return;
        }
      pause_(opts_.poll_interval);
    }
}

void
session::transition_(state_type next)
{
  log::trace ("%1% -> %2%") % name (state_) % name (next);

  state_ = next;
  signal_state_(next);
}

session::state_type
session::fail_(fault_info::kind_type kind, const std::string& message,
               uint16_t flags)
{
  fault_ = fault_info (kind, flags, message);

  log::error ("%1% fault while %2%: %3%")
    % fault_info::name (kind) % name (state_) % message;

  transition_(FAULTED);
  return state_;
}

bool
session::cancel_requested_() const
{
  std::lock_guard< std::mutex > lock (mutex_);
  return cancelled_;
}

void
session::pause_(double seconds) const
{
  struct timespec t;
  t.tv_sec  =  seconds;
  t.tv_nsec = (seconds - t.tv_sec) * 1000000000;

  // resume after signal interruptions
  while (-1 == nanosleep (&t, &t) && EINTR == errno)
    ;
}

system_error::error_code
session::fault_info::code () const
{
  if (NONE == kind) return system_error::no_error;
  if (DEVICE != kind) return system_error::unknown_error;

  if (error_flags & error_flag::COVER_OPEN)
    return system_error::cover_open;
  if (error_flags & (error_flag::NO_MEDIA
                     | error_flag::END_OF_MEDIA
                     | error_flag::REPLACE_MEDIA))
    return system_error::media_out;
  if (error_flags & error_flag::CUTTER_JAM)
    return system_error::media_jam;
  if (error_flags & error_flag::OVERHEATING)
    return system_error::overheated;
  if (error_flags & error_flag::WEAK_BATTERIES)
    return system_error::battery_low;

  return system_error::unknown_error;
}

const char *
session::fault_info::name (kind_type kind)
{
  switch (kind)
    {
    case NONE:           return "no";
    case TRANSPORT:      return "transport";
    case DECODE:         return "decode";
    case MEDIA_MISMATCH: return "media mismatch";
    case DEVICE:         return "device";
    case TIMEOUT:        return "timeout";
    case CANCELLED:      return "cancelled";
    }
  return "unknown";
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
