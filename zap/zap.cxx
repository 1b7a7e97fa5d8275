// file      : zap/zap.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <limits>
#include <csignal>     // signal()
#include <cstdlib>     // getenv()
#include <cstring>     // strcmp()
#include <iostream>
#include <type_traits> // enable_if, is_base_of

#include <libbutl/version.hxx>         // LIBBUTL_VERSION_ID
#include <libbutl/default-options.hxx>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/version.hxx>
#include <zap/diagnostics.hxx>
#include <zap/zap-options.hxx>

// Commands.
//
#include <zap/help.hxx>

#include <zap/cmd-host.hxx>
#include <zap/cmd-query.hxx>
#include <zap/cmd-install.hxx>

using namespace std;
using namespace butl;
using namespace zap;

namespace zap
{
  // Get the default options files (zap.options and zap-<cmd>.options) from
  // $XDG_CONFIG_HOME/zap/ (or ~/.config/zap/).
  //
  static inline default_options_files
  options_files (const char* cmd)
  {
    return default_options_files {
      {path ("zap.options"), path (string ("zap-") + cmd + ".options")},
      nullopt /* start */};
  }

  int
  main (int argc, char* argv[]);
}

// Command line arguments starting position.
//
// We want the positions of the command line arguments to be after the
// default options files. Normally that would be achieved by passing the last
// position of the previous scanner to the next. The problem is that we
// parse the command line arguments first (for good reasons). Also the
// default options files parsing machinery needs the maximum number of
// arguments to be specified and assigns the positions below this value (see
// load_default_options() for details). So we are going to "reserve" the
// first half of the size_t value range for the default options positions
// and the second half for the command line arguments positions.
//
static const size_t args_pos (numeric_limits<size_t>::max () / 2);

// Initialize the command option class O with the common options and then
// parse the rest of the command line placing non-option arguments to args.
// Once this is done, use the "final" values of the common options to do
// global initializations (verbosity level, etc).
//
template <typename O>
static O
init (const common_options& co,
      cli::scanner& scan,
      strings& args, cli::vector_scanner& args_scan,
      const char* cmd)
{
  tracer trace ("init");

  O o;
  static_cast<common_options&> (o) = co;

  // We want to be able to specify options and arguments in any order (it is
  // really handy to just add -v at the end of the command line).
  //
  for (bool opt (true); scan.more (); )
  {
    if (opt)
    {
      // Parse the next chunk of options until we reach an argument (or eos).
      //
      if (o.parse (scan) && !scan.more ())
        break;

      // If we see first "--", then we are done parsing options.
      //
      if (strcmp (scan.peek (), "--") == 0)
      {
        scan.next ();
        opt = false;
        continue;
      }

      // Fall through.
    }

    args.push_back (scan.next ());
  }

  // Carry over the positions of the arguments. In particular, this can be
  // used to get the max position for the options.
  //
  args_scan.reset (0, scan.position ());

  // Note that the diagnostics verbosity level can only be calculated after
  // default options are loaded and merged (see below). Thus, to trace the
  // default options files search, we refer to the verbosity level specified
  // on the command line.
  //
  auto verbosity = [&o] ()
  {
    return o.verbose_specified ()
           ? o.verbose ()
           : o.V () ? 3 : o.v () ? 2 : o.quiet () ? 0 : 1;
  };

  // Handle default options files.
  //
  if (!o.no_default_options ())
  try
  {
    default_options<O> dos (
      load_default_options<O, cli::argv_file_scanner, cli::unknown_mode> (
        nullopt /* sys_dir */,
        nullopt /* home_dir */,
        config_home () / dir_path ("zap"),
        options_files (cmd),
        [&trace, &verbosity] (const path& f, bool r, bool o)
        {
          if (verbosity () >= 3)
          {
            if (o)
              trace << "treating " << f << " as " << (r ? "remote" : "local");
            else
              trace << "loading " << (r ? "remote " : "local ") << f;
          }
        },
        "--options-file",
        args_pos,
        1024));

    // Merge the default and command line options, making sure that the
    // --progress and --no-progress options specified on the command line
    // override the ones from the default options files.
    //
    optional<bool> progress;
    auto merge_no = [&progress] (const O& o,
                                 const default_options_entry<O>* e = nullptr)
    {
      if (o.progress () && o.no_progress ())
      {
        diag_record dr;
        (e != nullptr ? dr << fail (location (e->file.string ())) : dr << fail)
          << "both --progress and --no-progress specified";
      }

      if (o.progress ())
        progress = true;
      else if (o.no_progress ())
        progress = false;
    };

    for (const default_options_entry<O>& e: dos)
      merge_no (e.options, &e);

    merge_no (o);

    o = merge_default_options (dos, o);

    if (progress)
    {
      o.progress (*progress);
      o.no_progress (!*progress);
    }
  }
  catch (const invalid_argument& e)
  {
    fail << "unable to load default options files: " << e;
  }
  catch (const pair<path, system_error>& e)
  {
    fail << "unable to load default options files: " << e.first << ": "
         << e.second;
  }
  catch (const system_error& e)
  {
    fail << "unable to obtain home directory: " << e;
  }

  // Diagnostics verbosity.
  //
  verb = verbosity ();

  return o;
}

int zap::
main (int argc, char* argv[])
try
{
  using namespace cli;

  if (fdterm (stderr_fd ()))
    stderr_term = std::getenv ("TERM");

  exec_dir = path (argv[0]).directory ();

  // Ignore SIGPIPE which we may get if the fetch program or the pager exits
  // prematurely.
  //
  if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
    fail << "unable to ignore broken pipe (SIGPIPE) signal: "
         << system_error (errno, generic_category ()); // Sanitize.

  argv_file_scanner argv_scan (argc, argv, "--options-file", false, args_pos);

  // First parse common options and --version/--help.
  //
  options o;
  o.parse (argv_scan, unknown_mode::stop);

  if (o.version ())
  {
    cout << "zap " << ZAP_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "Copyright (c) " << ZAP_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  strings argsv; // To be filled by init() above.
  vector_scanner args (argsv);

  const common_options& co (o);

  if (o.help ())
  {
    init<help_options> (co, argv_scan, argsv, args, "help");
    return help ("", nullptr);
  }

  // The next argument should be a command.
  //
  if (!argv_scan.more ())
    fail << "zap command expected" <<
      info << "run 'zap help' for more information";

  int cmd_argc (2);
  char* cmd_argv[] {argv[0], const_cast<char*> (argv_scan.next ())};
  commands cmd;
  cmd.parse (cmd_argc, cmd_argv, true, unknown_mode::stop);

  if (cmd_argc != 1)
    fail << "unknown zap command/option '" << cmd_argv[1] << "'" <<
      info << "run 'zap help' for more information";

  // If the command is 'help', then what's coming next is another command.
  // Parse it into cmd so that we only need to check for each command in one
  // place.
  //
  bool h (cmd.help ());

  if (h)
  {
    init<help_options> (co, argv_scan, argsv, args, "help");

    if (!args.more ())
      return help ("", nullptr);

    cmd_argc = 2;
    cmd_argv[1] = const_cast<char*> (args.next ());

    cmd = commands (); // Clear the help option.
    cmd.parse (cmd_argc, cmd_argv, true, unknown_mode::stop);

    if (cmd_argc != 1)
      fail << "unknown zap command '" << cmd_argv[1] << "'" <<
        info << "run 'zap help' for more information";
  }

  // Handle commands.
  //
  int r (1);
  for (;;) // Breakout loop.
  try
  {
    if (cmd.help ())
    {
      assert (h);
      r = help ("help", &help_options::print_usage);
      break;
    }

    // if (cmd.search ())
    // {
    //   if (h)
    //     r = help ("search", &search_options::print_usage);
    //   else
    //     r = cmd_search (init<search_options> (co, ...), args);
    //
    //   break;
    // }
    //
#define COMMAND(CMD)                                                    \
    if (cmd.CMD ())                                                     \
    {                                                                   \
      if (h)                                                            \
        r = help (#CMD, &CMD##_options::print_usage);                   \
      else                                                              \
        r = cmd_##CMD (                                                 \
          init<CMD##_options> (co, argv_scan, argsv, args, #CMD),       \
          args);                                                        \
                                                                        \
      break;                                                            \
    }

    COMMAND (search);
    COMMAND (info);
    COMMAND (install);
    COMMAND (update);
    COMMAND (list);
    COMMAND (managers);
    COMMAND (system);

    assert (false);
    fail << "unhandled command";
  }
  catch (const failed& e)
  {
    r = e.code;
    break;
  }

  if (r != 0)
    return r;

  // Warn if args contain some leftover junk. We already successfully
  // performed the command so failing would probably be misleading.
  //
  if (args.more ())
  {
    diag_record dr;
    dr << warn << "ignoring unexpected argument(s)";
    while (args.more ())
      dr << " '" << args.next () << "'";
  }

  return 0;
}
catch (const failed& e)
{
  return e.code; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return zap::main (argc, argv);
}
