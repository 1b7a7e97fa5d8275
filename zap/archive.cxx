// file      : zap/archive.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/archive.hxx>

#include <zap/package.hxx>
#include <zap/diagnostics.hxx>

using namespace std;

namespace zap
{
  pair<process, process>
  start_extract (const common_options& co, const path& a, const dir_path& d)
  {
    cstrings args;

    // See if we need to decompress.
    //
    {
      const char* dc (nullptr);
      string e (a.extension ());

      if      (e == "gz")                  dc = "gzip";
      else if (e == "bz2" || e == "bzip2") dc = "bzip2";
      else if (e == "xz")                  dc = "xz";
      else if (e == "zst")                 dc = "zstd";
      else if (e != "tar")
        throw package_error (package_error_kind::build,
                             "unknown compression method in " + a.string ());

      if (dc != nullptr)
        args.push_back (dc);
    }

    size_t i (0); // The tar command line start.
    if (!args.empty ())
    {
      args.push_back ("-dc");
      args.push_back (a.string ().c_str ());
      args.push_back (nullptr);
      i = args.size ();
    }

    args.push_back (co.tar ().string ().c_str ());

    // Add user's extra options.
    //
    for (const string& o: co.tar_option ())
      args.push_back (o.c_str ());

    args.push_back ("-xf");
    args.push_back (i == 0 ? a.string ().c_str () : "-");

    // -C/--directory -- change to directory.
    //
    args.push_back ("-C");
    args.push_back (d.string ().c_str ());

    args.push_back (nullptr);
    args.push_back (nullptr); // Pipe end.

    size_t what;
    try
    {
      process_path dpp;
      process_path tpp;

      process dpr;
      process tpr;

      if (i != 0)
        dpp = process::path_search (args[what = 0]);

      tpp = process::path_search (args[what = i]);

      if (verb >= 2)
        print_process (args);

      if (i != 0)
      {
        dpr = process (dpp, &args[what = 0], 0, -1);
        tpr = process (tpp, &args[what = i], dpr);
      }
      else
      {
        dpr = process (process_exit (0)); // Successfully exited.
        tpr = process (tpp, &args[what = 0]);
      }

      return make_pair (move (dpr), move (tpr));
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[what] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  void
  extract (const common_options& co, const path& a, const dir_path& d)
  {
    pair<process, process> pr (start_extract (co, a, d));

    // While it is reasonable to assume the child process issued diagnostics
    // if exited with an error status, tar, specifically, doesn't mention the
    // archive name. So print the error message whatever the child exit
    // status is.
    //
    try
    {
      if (pr.second.wait () && pr.first.wait ())
        return;
    }
    catch (const process_error& e)
    {
      throw package_error (package_error_kind::build,
                           string ("unable to extract ") + a.string () +
                           ": " + e.what ());
    }

    throw package_error (package_error_kind::build,
                         "unable to extract " + a.string () + " to " +
                         d.string ());
  }
}
