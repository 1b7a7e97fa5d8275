// file      : zap/sudo.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/sudo.hxx>

#include <thread>

#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  int
  main ()
  {
    verb = 0;

    const cstrings install {"pacman", "-S", "--noconfirm", "htop", nullptr};

    // Running as root: no credential, no sudo prefix.
    //
    {
      sudo_session::simulation s;
      s.elevated = true;

      sudo_session ss;
      ss.simulate_ = &s;

      assert (!ss.needs_elevation ());
      assert (ss.run (install));

      assert (s.prompts == 0);
      assert (s.commands.size () == 1);
      assert ((s.commands[0] ==
               strings {"pacman", "-S", "--noconfirm", "htop"}));
    }

    // Passwordless sudo: no prompt, commands run without -S.
    //
    {
      sudo_session::simulation s;
      s.passwordless = true;

      sudo_session ss;
      ss.simulate_ = &s;

      assert (ss.needs_elevation ());

      ss.ensure_credential ();
      ss.ensure_credential ();

      assert (ss.run (install));

      assert (s.prompts == 0);
      assert ((s.commands[0] ==
               strings {"sudo", "pacman", "-S", "--noconfirm", "htop"}));
    }

    // Concurrent callers are prompted once and the commands receive the
    // password through stdin.
    //
    {
      sudo_session::simulation s;
      s.password = "secret";
      s.answers = {"secret", "secret"};

      size_t executed (0);
      s.execute = [&executed] (const strings& a)
      {
        ++executed; // Serialized by the session.
        return a[0] == "pacman";
      };

      sudo_session ss (path ("/usr/bin/sudo"));
      ss.simulate_ = &s;

      vector<thread> ts;
      for (size_t i (0); i != 8; ++i)
        ts.emplace_back ([&ss, &install] () {ss.run (install);});

      for (thread& t: ts)
        t.join ();

      assert (s.prompts == 1);
      assert (executed == 8);
      assert (s.commands.size () == 8);

      for (const strings& c: s.commands)
        assert ((c == strings {"/usr/bin/sudo", "-S",
                               "pacman", "-S", "--noconfirm", "htop"}));

      // The exit status is propagated.
      //
      assert (!ss.run (cstrings {"false", nullptr}));
      assert (s.prompts == 1);
    }

    // Rejected password is fatal and final.
    //
    {
      sudo_session::simulation s;
      s.password = "secret";
      s.answers = {"wrong", "secret"};

      sudo_session ss;
      ss.simulate_ = &s;

      bool f (false);
      try
      {
        ss.ensure_credential ();
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
      assert (s.prompts == 1);
      assert (s.commands.empty ());

      // Neither the next attempt nor a command prompts again.
      //
      f = false;
      try
      {
        ss.ensure_credential ();
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);

      f = false;
      try
      {
        ss.run (install);
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
      assert (s.prompts == 1);
      assert (s.commands.empty ());
    }

    // No more answers (end of input) is fatal.
    //
    {
      sudo_session::simulation s;
      s.password = "secret";

      sudo_session ss;
      ss.simulate_ = &s;

      bool f (false);
      try
      {
        ss.run (install);
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
      assert (s.commands.empty ());
    }

    // Captured output.
    //
    {
      sudo_session::simulation s;
      s.passwordless = true;
      s.output = [] (const strings& a)
      {
        return a[0] == "pacman" ? string ("synced\n") : string ();
      };

      sudo_session ss;
      ss.simulate_ = &s;

      optional<string> o (ss.run_output (cstrings {"pacman", "-Sy", nullptr}));
      assert (o && *o == "synced\n");
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
