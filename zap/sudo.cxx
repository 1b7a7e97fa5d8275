// file      : zap/sudo.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/sudo.hxx>

#include <unistd.h>  // geteuid(), isatty(), STDIN_FILENO
#include <termios.h> // tcgetattr(), tcsetattr()

#include <iostream> // cin

#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  bool sudo_session::
  needs_elevation () const
  {
    if (simulate_ != nullptr)
      return !simulate_->elevated;

    return geteuid () != 0;
  }

  // Write the password followed by newline to the process stdin and close
  // it.
  //
  static void
  write_password (process& pr, const string& pw)
  {
    tracer trace ("write_password");

    try
    {
      ofdstream os (move (pr.out_fd));
      os << pw << '\n';
      os.close ();
    }
    catch (const io_error& e)
    {
      // Sudo may have exited without reading stdin, in which case its exit
      // status will tell the story.
      //
      l4 ([&]{trace << "unable to write password: " << e;});
    }
  }

  bool sudo_session::
  probe ()
  {
    const char* args[] = {sudo_.string ().c_str (), "-n", "true", nullptr};

    if (verb >= 3)
      print_process (args);

    if (simulate_ != nullptr)
      return simulate_->passwordless;

    try
    {
      process_path pp (process::path_search (args[0]));
      process pr (pp, args, -2, -2, -2); // Redirect everything to /dev/null.
      return pr.wait ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  bool sudo_session::
  verify (const string& pw)
  {
    const char* args[] = {sudo_.string ().c_str (), "-S", "-v", nullptr};

    if (verb >= 3)
      print_process (args);

    if (simulate_ != nullptr)
      return pw == simulate_->password;

    try
    {
      process_path pp (process::path_search (args[0]));
      process pr (pp, args, -1, -2, -2); // Pipe stdin, stdout/stderr to null.

      write_password (pr, pw);

      return pr.wait ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  string sudo_session::
  prompt ()
  {
    if (simulate_ != nullptr)
    {
      simulation& s (*simulate_);

      if (s.prompts == s.answers.size ())
        fail << "unable to read password: end of input" << endf;

      return s.answers[s.prompts++];
    }

    if (!isatty (STDIN_FILENO))
      fail << "password required to run privileged commands" <<
        info << "standard input is not a terminal" <<
        info << "configure passwordless " << sudo_ << " or run as root"
           << endf;

    *diag_stream << "[sudo] password required for installation: " << flush;

    // Disable echo for the duration of the input.
    //
    termios t {};
    bool e (tcgetattr (STDIN_FILENO, &t) == 0);
    termios o (t);

    if (e)
    {
      t.c_lflag &= ~ECHO;
      tcsetattr (STDIN_FILENO, TCSANOW, &t);
    }

    auto g (make_guard ([e, &o] ()
                        {
                          if (e)
                            tcsetattr (STDIN_FILENO, TCSANOW, &o);

                          *diag_stream << endl;
                        }));

    string r;
    if (!getline (cin, r))
      fail << "unable to read password" << endf;

    return r;
  }

  void sudo_session::
  ensure_credential ()
  {
    tracer trace ("sudo_session::ensure_credential");

    if (!needs_elevation ())
      return;

    lock_guard<mutex> l (state_mutex_);

    if (credential_)
      return;

    // Once the credential could not be obtained, every further privileged
    // command fails without another prompt.
    //
    if (auth_failed_)
      throw failed (); // Diagnostics has already been issued.

    try
    {
      if (probe ())
      {
        l4 ([&]{trace << "passwordless " << sudo_;});

        credential_ = string ();
        return;
      }

      string pw (prompt ());

      if (!verify (pw))
        fail << "unable to obtain privileges with " << sudo_ <<
          info << "make sure the password is correct";

      l4 ([&]{trace << "password verified";});

      credential_ = move (pw);
    }
    catch (const failed&)
    {
      auth_failed_ = true;
      throw;
    }
  }

  bool sudo_session::
  command (const cstrings& args, cstrings& cmd) const
  {
    bool r (false);

    if (needs_elevation ())
    {
      cmd.push_back (sudo_.string ().c_str ());

      if (!credential_->empty ())
      {
        cmd.push_back ("-S");
        r = true;
      }
    }

    cmd.insert (cmd.end (), args.begin (), args.end ());

    if (cmd.back () != nullptr)
      cmd.push_back (nullptr);

    return r;
  }

  bool sudo_session::
  simulate (const cstrings& cmd, size_t n, string* out)
  {
    simulation& s (*simulate_);

    strings c;
    strings a;

    for (size_t i (0); cmd[i] != nullptr; ++i)
    {
      c.push_back (cmd[i]);

      if (i >= n)
        a.push_back (cmd[i]);
    }

    s.commands.push_back (move (c));

    if (out != nullptr && s.output)
      *out = s.output (a);

    return s.execute ? s.execute (a) : true;
  }

  bool sudo_session::
  run (const cstrings& args, const dir_path& cwd)
  {
    ensure_credential ();

    lock_guard<mutex> l (run_mutex_);

    cstrings cmd;
    bool pw (command (args, cmd));
    size_t n (needs_elevation () ? (pw ? 2 : 1) : 0); // Sudo and its options.

    if (verb >= 2)
      print_process (cmd);

    if (simulate_ != nullptr)
      return simulate (cmd, n, nullptr);

    try
    {
      process_path pp (process::path_search (cmd[0]));
      process pr (pp,
                  cmd.data (),
                  pw ? -1 : 0, 1, 2,
                  cwd.empty () ? nullptr : cwd.string ().c_str ());

      if (pw)
        write_password (pr, *credential_);

      return pr.wait ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << cmd[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  optional<string> sudo_session::
  run_output (const cstrings& args)
  {
    ensure_credential ();

    lock_guard<mutex> l (run_mutex_);

    cstrings cmd;
    bool pw (command (args, cmd));
    size_t n (needs_elevation () ? (pw ? 2 : 1) : 0);

    if (verb >= 3)
      print_process (cmd);

    if (simulate_ != nullptr)
    {
      string r;
      if (simulate (cmd, n, &r))
        return r;

      return nullopt;
    }

    try
    {
      process_path pp (process::path_search (cmd[0]));
      process pr (pp, cmd.data (), pw ? -1 : 0, -1, 2);

      if (pw)
        write_password (pr, *credential_);

      string r;
      try
      {
        ifdstream is (move (pr.in_ofd), ifdstream::badbit);
        r = is.read_text ();
        is.close ();
      }
      catch (const io_error& e)
      {
        if (pr.wait ())
          fail << "unable to read " << cmd[0] << " output: " << e;

        // Fall through.
      }

      if (pr.wait ())
        return r;

      return nullopt;
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << cmd[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }
}
