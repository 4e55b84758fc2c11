//  exception.hpp -- driver specific error conditions
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

#ifndef drivers_brother_exception_hpp_
#define drivers_brother_exception_hpp_

#include <stdexcept>
#include <string>

namespace ptouch {
namespace _drv_ {
namespace brother {

using std::invalid_argument;
using std::logic_error;
using std::runtime_error;

//! A status reply that cannot be interpreted
class decode_error : public runtime_error
{
public:
  enum reason_type {
    BAD_LENGTH,                 //!< not exactly one status frame
    BAD_SIGNATURE,              //!< fixed header bytes do not match
  };

  decode_error (reason_type reason, const std::string& message)
    : runtime_error (message)
    , reason_(reason)
  {}

  reason_type reason () const { return reason_; }

private:
  reason_type reason_;
};

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_exception_hpp_ */
