//  main.cpp -- print labels on Brother P-touch printers
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

#include <cstdlib>

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/regex.hpp>
#include <boost/throw_exception.hpp>

#include "ptouch/connexion.hpp"
#include "ptouch/log.hpp"
#include "connexions/usb.hpp"
#include "drivers/brother/bitmap.hpp"
#include "drivers/brother/model.hpp"
#include "drivers/brother/session.hpp"
#include "filters/pbm.hpp"

namespace po = boost::program_options;

using namespace ptouch;
using namespace ptouch::_drv_::brother;

using std::runtime_error;

namespace {

//! Maps PTOUCH_LOG_LEVEL and friends onto their option names
struct env_var_mapper
{
  po::options_description opts_;

  enum { approx = true, exact = false };

  env_var_mapper (const po::options_description& opts)
    : opts_(opts)
  {}

  std::string
  operator() (const std::string& env_var)
  {
    static boost::regex re (PACKAGE_ENV_VAR_PREFIX "([A-Z0-9_]+)");
    boost::smatch var;

    if (!boost::regex_match (env_var, var, re)) return std::string ();

    std::string option (boost::algorithm::to_lower_copy
                        (std::string (var[1])));
    boost::algorithm::replace_all (option, "_", "-");

    if ("config" != option
        && opts_.find_nothrow (option, exact))
      return option;

    return std::string ();
  }
};

//! Reports print progress every so many lines
struct progress
{
  void operator() (streamsize done, streamsize total) const
  {
    if (done == total || 0 == done % 64)
      log::brief ("sent %1% of %2% raster lines") % done % total;
  }
};

struct state_logger
{
  void operator() (session::state_type state) const
  {
    log::brief ("session: %1%") % session::name (state);
  }
};

void
show_status (const status& st, const model& m)
{
  std::cout << "model         : " << m.name << "\n"
            << "resolution    : " << m.dpi << " dpi, "
            << m.pins << " pins\n"
            << "media         : " << st.media () << "\n"
            << "tape colour   : " << status::colour_name (st.tape_colour ())
            << "\n"
            << "text colour   : " << status::colour_name (st.text_colour ())
            << "\n"
            << "errors        : "
            << (st.has_error ()
                ? error_flag::describe (st.error_flags ())
                : std::string ("none")) << "\n"
            << "status type   : " << status::name (st.type ()) << "\n"
            << "phase         : "
            << (status::PRINTING == st.phase () ? "printing" : "receiving")
            << "\n";

  boost::optional< media::area > a (st.media ().print_area ());
  if (a)
    std::cout << "printable pins: " << a->printable
              << " (margin " << a->margin << ")\n";
}

std::vector< raster_line >
rasterize (const _flt_::pbm& img, const media::area& a, const model& m)
{
  if (img.height () > a.printable)
    BOOST_THROW_EXCEPTION
      (runtime_error ((format ("image is %1% pixels high but only %2% "
                               "fit on the media") % img.height ()
                       % a.printable).str ()));

  // center the image across the printable area
  uint16_t offset = a.margin + (a.printable - img.height ()) / 2;
  bitmap bm (offset, img.height (), m.line_bytes ());

  for (streamsize x = 0; x < img.width (); ++x)
    bm.add_line (img.column (x));

  return bm.lines ();
}

}       // namespace

int
main (int argc, char *argv[])
{
  try
    {
      std::string model_name;
      std::string log_level;
      std::string config_file;
      std::string command;
      std::string image_file;
      unsigned    index;
      unsigned    expect_width;
      unsigned    cut_every;

      job::options_type       job_opts;
      session::options        ses_opts;

      po::options_description gnu_opts ("GNU standard options");
      gnu_opts
        .add_options ()
        ("help"   , "display this help and exit")
        ("version", "output version information and exit")
        ;

      po::options_description dev_opts ("Device options");
      dev_opts
        .add_options ()
        ("model", po::value< std::string > (&model_name)
         ->default_value ("pt-p750w"),
         ("printer model, one of "
          + boost::algorithm::join (model::names (), ", ")).c_str ())
        ("index", po::value< unsigned > (&index)->default_value (0),
         "which printer to use when several of the same model are"
         " attached")
        ("debug", po::bool_switch (),
         "log device I/O in hexdump format, implies --log-level debug")
        ("log-level", po::value< std::string > (&log_level)
         ->default_value ("error"),
         "one of fatal, alert, error, brief, trace or debug")
        ;

      po::options_description prt_opts ("Print options");
      prt_opts
        .add_options ()
        ("no-cut", po::bool_switch (), "do not cut the label")
        ("half-cut", po::bool_switch (&job_opts.half_cut),
         "cut through the label but not the backing")
        ("chain", po::bool_switch (&job_opts.chain_printing),
         "do not feed the last label out")
        ("compress", po::bool_switch (&job_opts.compress),
         "send compressed raster data")
        ("high-res", po::bool_switch (&job_opts.high_resolution),
         "print at double resolution along the tape")
        ("mirror", po::bool_switch (&job_opts.mirror),
         "print mirrored")
        ("copies", po::value< uint16_t > (&job_opts.copies)
         ->default_value (1), "number of labels to print")
        ("cut-every", po::value< unsigned > (&cut_every)
         ->default_value (1), "labels per cut")
        ("margin", po::value< uint16_t > (&job_opts.margin_dots)
         ->default_value (14), "feed before and after printing, in dots")
        ("expect-width", po::value< unsigned > (&expect_width)
         ->default_value (0),
         "refuse to print unless the media has this width in mm")
        ;

      po::options_description ses_desc ("Session options");
      ses_desc
        .add_options ()
        ("write-attempts", po::value< unsigned > (&ses_opts.write_attempts)
         ->default_value (ses_opts.write_attempts),
         "tries per command before giving up")
        ("write-timeout", po::value< double > (&ses_opts.write_timeout)
         ->default_value (ses_opts.write_timeout),
         "seconds to wait for a write to complete")
        ("status-timeout", po::value< double > (&ses_opts.status_timeout)
         ->default_value (ses_opts.status_timeout),
         "seconds to wait for a status reply")
        ("poll-interval", po::value< double > (&ses_opts.poll_interval)
         ->default_value (ses_opts.poll_interval),
         "seconds between status polls while printing")
        ("completion-timeout",
         po::value< double > (&ses_opts.completion_timeout)
         ->default_value (ses_opts.completion_timeout),
         "seconds to wait for printing to complete")
        ("config", po::value< std::string > (&config_file),
         "read further options from this file")
        ;

      po::options_description pos_desc;
      pos_desc
        .add_options ()
        ("COMMAND", po::value< std::string > (&command))
        ("FILE", po::value< std::string > (&image_file))
        ;

      po::positional_options_description pos_args;
      pos_args
        .add ("COMMAND", 1)
        .add ("FILE", 1)
        ;

      po::options_description visible;
      visible
        .add (gnu_opts)
        .add (dev_opts)
        .add (prt_opts)
        .add (ses_desc)
        ;

      po::options_description cmd_line;
      cmd_line
        .add (visible)
        .add (pos_desc)
        ;

      po::options_description settings;
      settings
        .add (dev_opts)
        .add (prt_opts)
        .add (ses_desc)
        ;

      // Earlier sources take precedence over later ones
      po::variables_map vm;
      po::store (po::command_line_parser (argc, argv)
                 .options (cmd_line)
                 .positional (pos_args)
                 .run (), vm);
      po::store (po::parse_environment (settings,
                                        env_var_mapper (settings)), vm);
      if (vm.count ("config"))
        {
          std::ifstream ifs (vm["config"].as< std::string > ().c_str ());
          if (!ifs)
            BOOST_THROW_EXCEPTION
              (runtime_error ((format ("cannot read configuration file"
                                       " '%1%'")
                               % vm["config"].as< std::string > ()).str ()));
          po::store (po::parse_config_file (ifs, settings), vm);
        }
      po::notify (vm);

      if (vm.count ("help"))
        {
          std::cout << "Usage: " << PACKAGE_NAME
                    << " [OPTION]... status\n"
                    << "  or:  " << PACKAGE_NAME
                    << " [OPTION]... info\n"
                    << "  or:  " << PACKAGE_NAME
                    << " [OPTION]... print FILE.pbm\n\n"
                    << "Print labels on Brother P-touch printers.\n\n"
                    << visible
                    << "\nOptions can also be set via " PACKAGE_ENV_VAR_PREFIX
                    << "* environment variables, e.g. "
                    << PACKAGE_ENV_VAR_PREFIX "LOG_LEVEL=trace.\n";
          return EXIT_SUCCESS;
        }
      if (vm.count ("version"))
        {
          std::cout << PACKAGE_STRING << "\n";
          return EXIT_SUCCESS;
        }

      log::threshold = log::to_priority (log_level);

      job_opts.auto_cut = !vm["no-cut"].as< bool > ();
      if (0 == cut_every || 0xff < cut_every)
        BOOST_THROW_EXCEPTION
          (std::invalid_argument ("cut-every must be between 1 and 255"));
      job_opts.cut_every = cut_every;

      if ("status" != command && "info" != command && "print" != command)
        BOOST_THROW_EXCEPTION
          (std::invalid_argument
           (command.empty ()
            ? std::string ("no command given, try --help")
            : (format ("unknown command: '%1%'") % command).str ()));

      if ("print" == command && image_file.empty ())
        BOOST_THROW_EXCEPTION
          (std::invalid_argument ("print needs an image file"));

      const model *m (model::find (model_name));
      if (!m)
        BOOST_THROW_EXCEPTION
          (std::invalid_argument ((format ("unknown model: '%1%'")
                                   % model_name).str ()));

      ses_opts.line_bytes = m->line_bytes ();

      _cnx_::usb_address address (model::vendor_id, m->product_id, index);

      if ("info" == command)
        {
          std::cout << _cnx_::usb_device_info (address.str ());
          return EXIT_SUCCESS;
        }

      connexion::ptr cnx (connexion::create ("usb", address.str (),
                                             vm["debug"].as< bool > ()));

      session s (cnx, ses_opts);

      if ("status" == command)
        {
          show_status (s.query (), *m);
          return EXIT_SUCCESS;
        }

      std::ifstream ifs (image_file.c_str (), std::ios::binary);
      if (!ifs)
        BOOST_THROW_EXCEPTION
          (runtime_error ((format ("cannot open '%1%'")
                           % image_file).str ()));
      _flt_::pbm img (_flt_::pbm::read (ifs));

      status st (s.query ());
      media loaded (st.media ());
      boost::optional< media::area > area (loaded.print_area ());
      if (!area)
        BOOST_THROW_EXCEPTION
          (runtime_error ((format ("no printable area known for %1%")
                           % loaded).str ()));

      boost::optional< media > hint;
      if (expect_width)
        hint = media (media::UNKNOWN, expect_width);

      job j (rasterize (img, *area, *m), hint, job_opts);

      s.connect_state (state_logger ());
      s.connect_update (progress ());

      if (session::COMPLETED != s.print (j))
        {
          std::cerr << PACKAGE_NAME << ": "
                    << session::fault_info::name (s.fault ().kind) << ": "
                    << s.fault ().message << "\n";
          return EXIT_FAILURE;
        }
    }
  catch (const po::error& e)
    {
      std::cerr << PACKAGE_NAME << ": " << e.what () << "\n";
      return EXIT_FAILURE;
    }
  catch (const boost::exception& e)
    {
      std::cerr << boost::diagnostic_information (e);
      return EXIT_FAILURE;
    }
  catch (std::exception& e)
    {
      std::cerr << PACKAGE_NAME << ": " << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
