//  session.hpp -- drive a print job through a printer
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

#ifndef drivers_brother_session_hpp_
#define drivers_brother_session_hpp_

#include <mutex>
#include <string>

#include <boost/optional.hpp>
#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>

#include "ptouch/connexion.hpp"
#include "ptouch/exception.hpp"

#include "command.hpp"
#include "job.hpp"
#include "media.hpp"
#include "status.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

using boost::signals2::connection;
using boost::signals2::signal;

//! Conversation with a single printer about a single job
/*! A session owns its connexion for as long as it lives and takes a
 *  job from the first invalidate all the way to the printer's report
 *  that printing completed, or to a fault.  The states it goes through
 *  are
 *
 *  \code
 *  DISCONNECTED -> INVALIDATED -> INITIALIZED -> MEDIA_CONFIGURED
 *    -> STREAMING -> FINALIZING -> AWAITING_COMPLETION -> COMPLETED
 *  \endcode
 *
 *  with a transition to FAULTED possible from any state but the two
 *  terminal ones.  Sessions are single use.  Retrying a failed job
 *  takes a fresh session.
 *
 *  All I/O happens on the thread that calls print().  Only cancel()
 *  may be called from another thread.
 */
class session
{
public:
  enum state_type {
    DISCONNECTED,
    INVALIDATED,
    INITIALIZED,
    MEDIA_CONFIGURED,
    STREAMING,
    FINALIZING,
    AWAITING_COMPLETION,
    COMPLETED,
    FAULTED,
  };

  //! Tunables, times in seconds
  struct options
  {
    streamsize line_bytes;
    unsigned   write_attempts;
    double     write_timeout;
    double     status_timeout;
    double     poll_interval;
    double     completion_timeout;

    options ()
      : line_bytes (16)
      , write_attempts (3)
      , write_timeout (5.0)
      , status_timeout (0.5)
      , poll_interval (0.1)
      , completion_timeout (30.0)
    {}
  };

  //! Why a session ended up FAULTED
  struct fault_info
  {
    enum kind_type {
      NONE,
      TRANSPORT,
      DECODE,
      MEDIA_MISMATCH,
      DEVICE,
      TIMEOUT,
      CANCELLED,
    };

    kind_type   kind;
    uint16_t    error_flags;    //!< as reported, for DEVICE faults
    std::string message;

    fault_info (kind_type k = NONE, uint16_t flags = 0,
                const std::string& msg = std::string ())
      : kind (k), error_flags (flags), message (msg)
    {}

    //! Most significant device condition behind the fault
    system_error::error_code code () const;

    static const char * name (kind_type kind);
  };

  typedef signal< void (state_type) >             state_signal_type;
  typedef signal< void (streamsize, streamsize) > update_signal_type;

  session (connexion::ptr cnx, const options& opts = options ());

  //! Prints \a j and returns the terminal state
  /*! Problems with the device, the transport or the media end up as a
   *  FAULTED session and are described by fault().  Problems with the
   *  arguments throw.  An invalid_argument is thrown for lines that
   *  do not match the configured line_bytes or when there is nothing
   *  to print.  A logic_error is thrown if the session was used
   *  before.
   */
  state_type print (const job& j);

  //! Asks the printer for its status
  /*! Sends the same prologue print() does and returns the decoded
   *  reply.  This does not change the session's state.  Failures are
   *  thrown as io_error, timeout_error or decode_error.
   */
  status query ();

  //! Requests the job to stop before the next raster line
  void cancel ();

  state_type state () const;
  const fault_info& fault () const;

  //! Media reported by the printer, once known
  const boost::optional< media >& reported_media () const;

  connection connect_state (const state_signal_type::slot_type& slot);

  //! Signals the number of lines written so far and the total
  connection connect_update (const update_signal_type::slot_type& slot);

  static const char * name (state_type state);

private:
  bool send_(const command& cmd);
  status recv_status_(double timeout);
  bool request_status_(boost::optional< status >& st);
  bool stream_(const job& j);
  void await_completion_();

  void transition_(state_type next);
  state_type fail_(fault_info::kind_type kind, const std::string& message,
                   uint16_t flags = 0);

  bool cancel_requested_() const;
  void pause_(double seconds) const;

  connexion::ptr cnx_;
  options        opts_;

  state_type state_;
  fault_info fault_;
  boost::optional< media > media_;

  mutable std::mutex mutex_;
  bool               cancelled_;

  state_signal_type  signal_state_;
  update_signal_type signal_update_;
};

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_session_hpp_ */
