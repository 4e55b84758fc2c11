//  job.hpp -- what to print and how
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

#ifndef drivers_brother_job_hpp_
#define drivers_brother_job_hpp_

#include <vector>

#include <boost/optional.hpp>

#include "buffer.hpp"
#include "media.hpp"

namespace ptouch {
namespace _drv_ {
namespace brother {

//! A fully rendered label and the settings to print it with
/*! Jobs are immutable once built.  A session only reads them.
 */
class job
{
public:
  struct options_type
  {
    bool     auto_cut;
    bool     compress;
    bool     high_resolution;
    bool     mirror;
    bool     half_cut;
    bool     chain_printing;
    uint16_t margin_dots;       //!< feed before and after printing
    uint16_t copies;
    uint8_t  cut_every;         //!< labels per cut, when auto cutting

    options_type ()
      : auto_cut (true)
      , compress (false)
      , high_resolution (false)
      , mirror (false)
      , half_cut (false)
      , chain_printing (false)
      , margin_dots (14)
      , copies (1)
      , cut_every (1)
    {}
  };

  job (const std::vector< raster_line >& lines,
       const boost::optional< media >& hint = boost::none,
       const options_type& options = options_type ())
    : lines_(lines)
    , hint_(hint)
    , options_(options)
  {}

  const std::vector< raster_line >& lines () const { return lines_; }
  const boost::optional< media >& hint () const { return hint_; }
  const options_type& options () const { return options_; }

private:
  std::vector< raster_line > lines_;
  boost::optional< media >   hint_;
  options_type               options_;
};

}       // namespace brother
}       // namespace _drv_
}       // namespace ptouch

#endif  /* drivers_brother_job_hpp_ */
