//  exception.hpp -- extensions to the std::exception hierarchy
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

#ifndef ptouch_exception_hpp_
#define ptouch_exception_hpp_

#include <stdexcept>
#include <string>

namespace ptouch {

//! Device related error conditions
/*! Inspired by C++11's std::system_error.  The error codes name the
 *  hardware conditions a printer may report in its status replies,
 *  not operating system errors.
 */
class system_error
  : public std::runtime_error
{
public:
  enum error_code {
    no_error = 0,

    battery_low,
    cover_open,
    media_jam,
    media_out,
    overheated,

    unknown_error               // keep this last
  };

  system_error ();
  explicit system_error (error_code ec);
  system_error (error_code ec, const std::string& message);
  system_error (error_code ec, const char *message);

  const error_code& code () const;

  //! Returns a short, human readable description of \a ec
  static const char * describe (error_code ec);

private:
  error_code ec_;
};

//! Failure to move octets across a connexion
class io_error
  : public std::runtime_error
{
public:
  io_error (const std::string& message)
    : std::runtime_error (message)
  {}
};

//! Nothing moved across a connexion within the allotted time
class timeout_error
  : public io_error
{
public:
  timeout_error (const std::string& message = "timed out")
    : io_error (message)
  {}
};

}       // namespace ptouch

#endif  /* ptouch_exception_hpp_ */
