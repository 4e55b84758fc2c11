//  model.cpp -- supported printer models
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

#include <boost/algorithm/string/predicate.hpp>

#include "model.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

namespace {

  const model models[] = {
    { "pt-e550w" , 0x2060, 128, 180 },
    { "pt-p750w" , 0x2062, 128, 180 },
    { "pt-p710bt", 0x20af, 128, 180 },
  };

  const size_t model_count = sizeof (models) / sizeof (*models);

}       // namespace

const uint16_t model::vendor_id;

const model *
model::find (const std::string& name)
{
  for (size_t i = 0; i < model_count; ++i)
    {
      if (boost::algorithm::iequals (name, models[i].name))
        return &models[i];
    }
  return nullptr;
}

const model *
model::find (uint16_t product_id)
{
  for (size_t i = 0; i < model_count; ++i)
    {
      if (product_id == models[i].product_id)
        return &models[i];
    }
  return nullptr;
}

std::vector< std::string >
model::names ()
{
  std::vector< std::string > rv;
  for (size_t i = 0; i < model_count; ++i)
    rv.push_back (models[i].name);
  return rv;
}

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch
