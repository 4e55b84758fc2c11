//  model.hpp -- supported printer models
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

#ifndef drivers_brother_model_hpp_
#define drivers_brother_model_hpp_

#include <string>
#include <vector>

#include "ptouch/octet.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! Model specific constants
/*! All supported models have a 128 pin, 180 dpi print head and take
 *  raster lines of 16 bytes.
 */
struct model
{
  static const uint16_t vendor_id = 0x04f9;

  const char *name;
  uint16_t    product_id;
  uint16_t    pins;
  uint16_t    dpi;

  uint16_t line_bytes () const { return pins / 8; }

  //! Looks up a model by its \a name, case insensitively
  /*! Returns a null pointer for unknown models.
   */
  static const model * find (const std::string& name);
  static const model * find (uint16_t product_id);

  static std::vector< std::string > names ();
};

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_model_hpp_ */
