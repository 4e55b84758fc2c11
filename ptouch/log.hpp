//  log.hpp -- Tools and API to log messages
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

#ifndef ptouch_log_hpp_
#define ptouch_log_hpp_

#include <ostream>
#include <sstream>
#include <string>
#include <thread>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>

namespace ptouch {

using boost::format;

class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG,                      //!<  the gory details
  } priority;

  //!  The priority at and above which messages will be logged
  static priority threshold;

  //!  Where log messages end up
  /*!  This refers to \c std::clog by default.  Redirect its buffer to
   *   capture log output.
   */
  static std::ostream& os_;

  //!  Formatted, self-outputting log messages
  /*!  Modeled after boost::format.  Arguments are fed with operator%()
   *   and the message writes itself to log::os_ when it goes out of
   *   scope.  Messages below the log::threshold never construct their
   *   format object so feeding them arguments costs next to nothing.
   *
   *   Missing arguments are not an error.  Their placeholders are
   *   output as is.
   */
  class message
  {
  public:
    typedef boost::format format_type;

    message ()
    {}

    message (priority lvl, const std::string& fmt)
    {
      if (lvl <= threshold)
        {
          timestamp_ = boost::posix_time::microsec_clock::local_time ();
          thread_id_ = std::this_thread::get_id ();
          fmt_ = format_type (fmt);
          fmt_->exceptions (boost::io::no_error_bits);
        }
    }

    message (message&& that)
      : timestamp_(that.timestamp_)
      , thread_id_(that.thread_id_)
      , fmt_(that.fmt_)
    {
      that.fmt_ = boost::none;
    }

    ~message ()
    {
      if (fmt_) os_ << std::string (*this);
    }

    //!  Feeds the argument \a t to a message
    template <typename T> message& operator% (const T& t)
    {
      if (fmt_) *fmt_ % t;
      return *this;
    }

    operator std::string () const
    {
      if (!fmt_) return std::string ();

      std::ostringstream os;
      os << *timestamp_ << "[" << *thread_id_ << "]: " << *fmt_
         << std::endl;
      return os.str ();
    }

  private:
    boost::optional<boost::posix_time::ptime> timestamp_;
    boost::optional<std::thread::id>          thread_id_;
    boost::optional<format_type>              fmt_;
  };

  //!  Prioritized log messages
  /*!  These let you write
   *
   *     \code
   *     log::error ("%1%: %2%") % who % what;
   *     \endcode
   *
   *   instead of the more verbose
   *
   *     \code
   *     log::message (log::ERROR, "%1%: %2%") % who % what;
   *     \endcode
   */
#define expand_named_ctor(ctor,level)                   \
  inline static message                                 \
  ctor (const std::string& fmt)                         \
  { return message (level, fmt); }                      \
  /**/

  expand_named_ctor (fatal, FATAL);
  expand_named_ctor (alert, ALERT);
  expand_named_ctor (error, ERROR);
  expand_named_ctor (brief, BRIEF);
  expand_named_ctor (trace, TRACE);
  expand_named_ctor (debug, DEBUG);

#undef expand_named_ctor

  //!  Maps a priority's name onto its value
  /*!  Accepts the lower case names of the priorities, "fatal" through
   *   "debug", and throws a std::invalid_argument for anything else.
   */
  static priority to_priority (const std::string& name);
};

}       // namespace ptouch

#endif  /* ptouch_log_hpp_ */
