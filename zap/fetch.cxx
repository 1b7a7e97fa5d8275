// file      : zap/fetch.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/fetch.hxx>

#include <mutex>

#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  // wget
  //
  static uint16_t wget_major;
  static uint16_t wget_minor;

  static bool
  check_wget (const path& prog)
  {
    tracer trace ("check_wget");

    // wget --version prints the version to stdout and exits with 0
    // status. The first line starts with "GNU Wget X.Y[.Z].
    //
    const char* args[] = {prog.string ().c_str (), "--version", nullptr};

    try
    {
      process_path pp (process::path_search (args[0]));

      if (verb >= 3)
        print_process (args);

      process pr (pp, args, 0, -1); // Redirect stdout to a pipe.

      string l;

      try
      {
        ifdstream is (move (pr.in_ofd), fdstream_mode::skip);

        getline (is, l);
        is.close ();

        if (!(pr.wait () && l.compare (0, 9, "GNU Wget ") == 0))
          return false;
      }
      catch (const io_error&)
      {
        return false;
      }

      // Extract the version. If something goes wrong, set the version
      // to 0 so that we treat it as a really old wget.
      //
      try
      {
        string s (l, 9);
        size_t p;
        wget_major = static_cast<uint16_t> (stoul (s, &p));

        if (p != s.size () && s[p] == '.')
          wget_minor = static_cast<uint16_t> (stoul (string (s, p + 1)));

        l4 ([&]{trace << "version " << wget_major << '.' << wget_minor;});
      }
      catch (const std::exception&)
      {
        wget_major = 0;
        wget_minor = 0;

        l4 ([&]{trace << "unable to extract version from '" << l << "'";});
      }

      return true;
    }
    catch (const process_error& e)
    {
      if (e.child)
        exit (1);

      return false;
    }
  }

  static process
  start_wget (const path& prog,
              const optional<size_t>& timeout,
              bool progress,
              bool no_progress,
              const strings& ops,
              const string& url,
              const path& out,
              const string& user_agent)
  {
    bool fo (!out.empty ()); // Output to file.

    const string& ua (user_agent.empty ()
                      ? ZAP_USER_AGENT " wget/" + to_string (wget_major) +
                        '.' + to_string (wget_minor)
                      : user_agent);

    cstrings args {
      prog.string ().c_str (),
      "-U", ua.c_str ()
    };

    // Wget 1.16 introduced the --show-progress option which in the quiet mode
    // (-q) shows a nice and tidy progress bar.
    //
    bool has_show_progress (wget_major > 1 ||
                            (wget_major == 1 && wget_minor >= 16));

    // Map verbosity level. If we are running quiet or at level 1 and the
    // output is stdout, then run wget quiet. If at level 1 and the output is
    // a file, then show the progress bar. At level 2 and 3 run it at the
    // default level (so we will print the command line and it will display
    // the progress, error messages, etc). Higher than that -- run it with
    // debug output. Always show the progress bar if requested explicitly,
    // even in the quiet mode.
    //
    if (verb < (fo ? 1 : 2))
    {
      bool quiet (true);

      if (progress)
      {
        if (has_show_progress)
          args.push_back ("--show-progress");
        else
          quiet = false;
      }

      if (quiet)
      {
        args.push_back ("-q");
        no_progress = false; // Already suppressed with -q.
      }
    }
    else if (fo && verb == 1)
    {
      if (has_show_progress)
      {
        args.push_back ("-q");

        if (!no_progress)
          args.push_back ("--show-progress");
        else
          no_progress = false; // Already suppressed with -q.
      }
    }
    else if (verb > 3)
      args.push_back ("-d");

    if (no_progress)
      args.push_back ("--no-verbose");

    string tm;
    if (timeout)
    {
      tm = "--timeout=" + to_string (*timeout);
      args.push_back (tm.c_str ());
    }

    // Add extra options. The idea if that they may override what we have set
    // before this point but not after (like -O below).
    //
    for (const string& o: ops)
      args.push_back (o.c_str ());

    string o (fo ? out.leaf ().string () : "-");
    args.push_back ("-O");
    args.push_back (o.c_str ());

    args.push_back (url.c_str ());
    args.push_back (nullptr);

    process_path pp (process::path_search (args[0]));

    if (verb >= 2)
      print_process (args);

    // If we are fetching into a file, change the wget's directory to that of
    // the output file. We do it this way so that we end up with just the file
    // name (rather than the whole path) in the progress report. Process
    // exceptions must be handled by the caller.
    //
    return fo
      ? process (pp, args.data (),
                 0, 1, 2,
                 out.directory ().string ().c_str ())
      : process (pp, args.data (), 0, -1);
  }

  // curl
  //
  static bool
  check_curl (const path& prog)
  {
    // curl --version prints the version to stdout and exits with 0
    // status. The first line starts with "curl X.Y.Z"
    //
    const char* args[] = {prog.string ().c_str (), "--version", nullptr};

    try
    {
      process_path pp (process::path_search (args[0]));

      if (verb >= 3)
        print_process (args);

      process pr (pp, args, 0, -1); // Redirect stdout to a pipe.

      try
      {
        ifdstream is (move (pr.in_ofd), fdstream_mode::skip);

        string l;
        getline (is, l);
        is.close ();

        return pr.wait () && l.compare (0, 5, "curl ") == 0;
      }
      catch (const io_error&)
      {
        // Fall through.
      }
    }
    catch (const process_error& e)
    {
      if (e.child)
        exit (1);

      // Fall through.
    }

    return false;
  }

  static process
  start_curl (const path& prog,
              const optional<size_t>& timeout,
              bool progress,
              bool no_progress,
              const strings& ops,
              const string& url,
              const path& out,
              const string& user_agent)
  {
    bool fo (!out.empty ()); // Output to file.

    const string& ua (user_agent.empty ()
                      ? string (ZAP_USER_AGENT " curl")
                      : user_agent);

    cstrings args {
      prog.string ().c_str (),
      "-f", // Fail on HTTP errors without printing the response body.
      "-L", // Follow redirects.
      "-A", ua.c_str ()
    };

    auto suppress_progress = [&args] ()
    {
      args.push_back ("-s");
      args.push_back ("-S"); // But show errors.
    };

    // Map verbosity level. If we are running quiet or at level 1 and the
    // output is stdout, then run curl quiet. If at level 1 and the output is
    // a file, then show the progress bar. At level 2 and 3 run it at the
    // default level (so we will print the command line and it will display
    // its elaborate progress). Higher than that -- run it verbose. Always
    // show the progress bar if requested explicitly, even in the quiet mode.
    //
    if (verb < (fo ? 1 : 2))
    {
      if (!progress)
      {
        suppress_progress ();
        no_progress = false;  // Already suppressed.
      }
    }
    else if (fo && verb == 1)
    {
      if (!no_progress)
        args.push_back ("--progress-bar");
    }
    else if (verb > 3)
      args.push_back ("-v");

    if (no_progress)
      suppress_progress ();

    string tm;
    if (timeout)
    {
      tm = to_string (*timeout);
      args.push_back ("--max-time");
      args.push_back (tm.c_str ());
    }

    // Add extra options. The idea is that they may override what we have set
    // before this point but not after.
    //
    for (const string& o: ops)
      args.push_back (o.c_str ());

    // Output. By default curl writes to stdout.
    //
    if (fo)
    {
      args.push_back ("-o");
      args.push_back (out.string ().c_str ());
    }

    args.push_back (url.c_str ());
    args.push_back (nullptr);

    process_path pp (process::path_search (args[0]));

    if (verb >= 2)
      print_process (args);
    else if (verb == 1 && fo && !no_progress)
      //
      // Unfortunately curl doesn't print the filename being fetched next to
      // the progress bar. So the best we can do is print it on the previous
      // line.
      //
      text << out.leaf () << ':';

    // Process exceptions must be handled by the caller.
    //
    return fo
      ? process (pp, args.data ())
      : process (pp, args.data (), 0, -1);
  }

  // The dispatcher.
  //
  // Cache the result of finding/testing the fetch program.
  //
  enum class fetch_kind {curl, wget};

  static path       path_;
  static fetch_kind kind_;

  // The backends may fetch concurrently.
  //
  static mutex      check_mutex_;

  static fetch_kind
  check (const common_options& o)
  {
    lock_guard<mutex> l (check_mutex_);

    if (!path_.empty ())
      return kind_; // Cached.

    if (o.fetch_specified ())
    {
      const path& p (path_ = o.fetch ());

      // Figure out which one it is.
      //
      const path& n (p.leaf ());
      const string& s (n.string ());

      if (s.find ("curl") != string::npos)
      {
        if (!check_curl (p))
          fail << p << " does not appear to be the 'curl' program";

        kind_ = fetch_kind::curl;
      }
      else if (s.find ("wget") != string::npos)
      {
        if (!check_wget (p))
          fail << p << " does not appear to be the 'wget' program";

        kind_ = fetch_kind::wget;
      }
      else
        fail << "unknown fetch program " << p;
    }
    else
    {
      // See if any is available. The preference order is curl then wget.
      //
      if (check_curl (path_ = path ("curl")))
        kind_ = fetch_kind::curl;
      else if (check_wget (path_ = path ("wget")))
        kind_ = fetch_kind::wget;
      else
        fail << "unable to find 'curl' or 'wget'" <<
          info << "use --fetch to specify the fetch program location";

      if (verb >= 3)
        info << "using '" << path_ << "' as the fetch program, "
             << "use --fetch to override";
    }

    return kind_;
  }

  process
  start_fetch (const common_options& o,
               const string& url,
               const path& out,
               const string& user_agent)
  {
    process (*f) (const path&,
                  const optional<size_t>&,
                  bool,
                  bool,
                  const strings&,
                  const string&,
                  const path&,
                  const string&) = nullptr;

    switch (check (o))
    {
    case fetch_kind::curl: f = &start_curl; break;
    case fetch_kind::wget: f = &start_wget; break;
    }

    optional<size_t> timeout;
    if (o.fetch_timeout_specified ())
      timeout = o.fetch_timeout ();

    try
    {
      return f (path_,
                timeout,
                o.progress (),
                o.no_progress (),
                o.fetch_option (),
                url,
                out,
                user_agent);
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << path_ << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  void
  fetch_file (const common_options& o, const string& url, const path& out)
  {
    process pr (start_fetch (o, url, out));

    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      throw package_error (
        package_error_kind::network,
        "unable to fetch " + url + ": " + (e.normal ()
                                           ? "exit code " +
                                             to_string (e.code ())
                                           : e.description ()));
    }
  }

  string
  fetch_text (const common_options& o, const string& url)
  {
    process pr (start_fetch (o, url));

    string r;
    try
    {
      ifdstream is (move (pr.in_ofd), fdstream_mode::skip, ifdstream::badbit);
      r = is.read_text ();
      is.close ();
    }
    catch (const io_error& e)
    {
      if (pr.wait ())
        throw package_error (package_error_kind::network,
                             "unable to read fetched " + url + ": " +
                             e.what ());

      // Fall through.
    }

    if (!pr.wait ())
    {
      const process_exit& e (*pr.exit);

      throw package_error (
        package_error_kind::network,
        "unable to fetch " + url + ": " + (e.normal ()
                                           ? "exit code " +
                                             to_string (e.code ())
                                           : e.description ()));
    }

    return r;
  }

  string
  url_encode (const string& s, bool query)
  {
    string r;

    for (char c: s)
    {
      if (alnum (c) || c == '-' || c == '_' || c == '.' || c == '~')
        r += c;
      else if (c == ' ' && query)
        r += '+';
      else
      {
        static const char digits[] = "0123456789ABCDEF";

        unsigned char u (static_cast<unsigned char> (c));

        r += '%';
        r += digits[u >> 4];
        r += digits[u & 0x0F];
      }
    }

    return r;
  }
}
