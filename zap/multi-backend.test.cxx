// file      : zap/multi-backend.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/multi-backend.hxx>

#include <set>

#include <zap/sudo.hxx>
#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  // Package manager with the packages specified upfront and the installs
  // recorded.
  //
  class test_manager: public package_manager
  {
  public:
    test_manager (const common_options& co, string id)
        : package_manager (co), id_ (move (id)) {}

    virtual const char*
    id () const override {return id_.c_str ();}

    virtual const char*
    name () const override {return id_.c_str ();}

    virtual packages
    search (const string& q) override
    {
      if (query_throws)
        throw package_error (package_error_kind::network, "unreachable");

      packages r;
      for (const package& p: available)
      {
        if (p.name.find (q) != string::npos)
          r.push_back (p);
      }
      return r;
    }

    virtual packages
    info (const strings& ns) override
    {
      if (info_failures != 0)
      {
        --info_failures;
        throw package_error (package_error_kind::network, "unreachable");
      }

      packages r;
      for (const string& n: ns)
      {
        for (const package& p: available)
        {
          if (p.name == n)
            r.push_back (p);
        }
      }
      return r;
    }

    virtual install_results
    install (const packages& ps) override
    {
      strings b;
      for (const package& p: ps)
        b.push_back (p.name);
      batches.push_back (move (b));

      if (install_throws)
        throw package_error (package_error_kind::build, "boom");

      bool s (sudo == nullptr ||
              sudo->run (cstrings {id_.c_str (), "install", nullptr}));

      install_results r;
      for (const package& p: ps)
      {
        if (!s)
          r.emplace_back (p.name, false, id_ + " install failed");
        else if (install_failures.find (p.name) != install_failures.end ())
          r.emplace_back (p.name, false, string ("makepkg failed"));
        else
          r.emplace_back (p.name, true);
      }
      return r;
    }

    virtual bool
    is_installed (const string&) override {return false;}

    virtual installed_packages
    list_installed () override {return installed_packages ();}

    virtual packages
    check_updates () override
    {
      if (query_throws)
        throw package_error (package_error_kind::parse, "garbage");

      if (sudo != nullptr &&
          !sudo->run_output (cstrings {id_.c_str (), "refresh", nullptr}))
        throw package_error (package_error_kind::network, "refresh failed");

      return outdated;
    }

    void
    add (const string& n, const string& v, bool url_path = true)
    {
      package p (n, v);
      if (url_path)
        p.extra.url_path = "/cgit/aur.git/snapshot/" + n + ".tar.gz";
      available.push_back (move (p));
    }

    packages         available;
    packages         outdated;
    std::set<string> install_failures;
    bool             install_throws = false;
    bool             query_throws = false;
    size_t           info_failures = 0;
    sudo_session*    sudo = nullptr; // Run privileged install and refresh.

    vector<strings>  batches;

  private:
    string id_;
  };

  struct test_backends
  {
    package_managers managers;
    std::map<string, test_manager*> by_id;

    explicit
    test_backends (const common_options& co, const strings& ids)
    {
      for (const string& id: ids)
      {
        unique_ptr<test_manager> m (new test_manager (co, id));
        by_id[id] = m.get ();
        managers.push_back (move (m));
      }
    }

    test_manager&
    operator[] (const string& id) {return *by_id.at (id);}
  };

  int
  main ()
  {
    verb = 0;

    common_options co;

    // Candidate ordering.
    //
    {
      strings rs {"go", "npm", "aur", "pacman", "apt"};

      assert ((candidate_backends (package_type::unknown, rs) ==
               strings {"pacman", "apt", "aur", "npm", "go"}));

      assert ((candidate_backends (package_type::go, rs) ==
               strings {"go", "pacman", "apt", "aur", "npm"}));

      assert ((candidate_backends (package_type::npm,
                                   strings {"pacman", "deno", "npm"}) ==
               strings {"npm", "deno", "pacman"}));

      assert ((candidate_backends (package_type::pip, strings {"aur"}) ==
               strings {"aur"}));

      assert (candidate_backends (package_type::unknown, strings ()).empty ());
    }

    // Dispatch into one singleton batch per backend. Note that htop is also
    // known to npm but the system package manager has the priority.
    //
    {
      test_backends tb (co, {"pacman", "aur", "npm", "go"});
      tb["pacman"].add ("htop", "3.3.0-1");
      tb["npm"].add ("htop", "0.1.0");
      tb["npm"].add ("@scope/z", "1.2.3");
      tb["go"].add ("github.com/x/y", "v1.0.0");

      multi_backend mb (move (tb.managers));

      install_results rs (
        mb.install_auto ({"htop", "github.com/x/y", "@scope/z"}));

      assert (rs.size () == 3);
      assert (rs[0].package == "htop"           && rs[0].success);
      assert (rs[1].package == "github.com/x/y" && rs[1].success);
      assert (rs[2].package == "@scope/z"       && rs[2].success);

      assert ((tb["pacman"].batches == vector<strings> {{"htop"}}));
      assert ((tb["go"].batches == vector<strings> {{"github.com/x/y"}}));
      assert ((tb["npm"].batches == vector<strings> {{"@scope/z"}}));
      assert (tb["aur"].batches.empty ());
    }

    // One batched install per backend, results in the requested order, and
    // the not found package.
    //
    {
      test_backends tb (co, {"pacman", "aur"});
      tb["pacman"].add ("a", "1");
      tb["pacman"].add ("c", "1");
      tb["aur"].add ("b", "1");
      tb["aur"].add ("d", "1");

      multi_backend mb (move (tb.managers));

      install_results rs (mb.install_auto ({"a", "b", "nosuch", "c", "d"}));

      assert (rs.size () == 5);
      assert (rs[0].package == "a" && rs[0].success);
      assert (rs[1].package == "b" && rs[1].success);
      assert (rs[2].package == "nosuch" && !rs[2].success);
      assert (*rs[2].message == "not found in any backend");
      assert (rs[3].package == "c" && rs[3].success);
      assert (rs[4].package == "d" && rs[4].success);

      assert ((tb["pacman"].batches == vector<strings> {{"a", "c"}}));
      assert ((tb["aur"].batches == vector<strings> {{"b", "d"}}));
    }

    // A community record without the snapshot path is not installable and
    // the query errors only skip the backend.
    //
    {
      test_backends tb (co, {"pacman", "aur", "npm"});
      tb["pacman"].info_failures = 1;
      tb["aur"].add ("ghost", "1", false /* url_path */);
      tb["npm"].add ("ghost", "2");

      multi_backend mb (move (tb.managers));

      install_results rs (mb.install_auto ({"ghost"}));

      assert (rs.size () == 1 && rs[0].success);
      assert (tb["aur"].batches.empty ());
      assert ((tb["npm"].batches == vector<strings> {{"ghost"}}));
    }

    // Community install failure is recovered with the primary backend.
    //
    {
      test_backends tb (co, {"pacman", "aur"});
      tb["pacman"].info_failures = 1; // Unavailable during the lookup.
      tb["pacman"].add ("foo", "1.0-1");
      tb["aur"].add ("foo", "1.1-1");
      tb["aur"].add ("bar", "1");
      tb["aur"].install_failures = {"foo", "bar"};

      multi_backend mb (move (tb.managers));

      install_results rs (mb.install_auto ({"foo", "bar"}));

      assert (rs.size () == 2);
      assert (rs[0].package == "foo" && rs[0].success);
      assert (rs[1].package == "bar" && !rs[1].success);
      assert (*rs[1].message == "makepkg failed");

      assert ((tb["aur"].batches == vector<strings> {{"foo", "bar"}}));
      assert ((tb["pacman"].batches == vector<strings> {{"foo"}}));
    }

    // The whole community batch fails.
    //
    {
      test_backends tb (co, {"pacman", "aur"});
      tb["pacman"].info_failures = 2;
      tb["pacman"].add ("foo", "1.0-1");
      tb["aur"].add ("foo", "1.0-1");
      tb["aur"].add ("bar", "1");
      tb["aur"].install_throws = true;

      multi_backend mb (move (tb.managers));

      install_results rs (mb.install_auto ({"foo", "bar"}));

      assert (rs[0].success);
      assert (!rs[1].success);
      assert (*rs[1].message ==
              "installation via aur failed: build error: boom");
    }

    // Concurrent queries keep the registration order and drop the failed
    // and empty responses.
    //
    {
      test_backends tb (co, {"pacman", "aur", "npm", "go"});
      tb["pacman"].add ("vim", "9.1");
      tb["pacman"].add ("vim-airline", "0.11");
      tb["aur"].query_throws = true;
      tb["go"].add ("vim", "v0.0.1");

      multi_backend mb (move (tb.managers));

      backend_packages_list bs (mb.search_all ("vim"));

      assert (bs.size () == 2);
      assert (strcmp (bs[0].manager->id (), "pacman") == 0);
      assert (bs[0].result.size () == 2);
      assert (strcmp (bs[1].manager->id (), "go") == 0);

      bs = mb.info_all ("vim");
      assert (bs.size () == 2);
    }

    // Updates.
    //
    {
      test_backends tb (co, {"pacman", "aur", "npm"});
      tb["pacman"].outdated.push_back (package ("vim", "9.2"));
      tb["aur"].query_throws = true;
      tb["npm"].outdated.push_back (package ("typescript", "5.5.0"));
      tb["npm"].outdated.push_back (package ("eslint", "9.0.0"));
      tb["npm"].install_failures = {"eslint"};

      multi_backend mb (move (tb.managers));

      backend_packages_list bs (mb.check_updates_all ());
      assert (bs.size () == 2);

      install_results rs (mb.update_all (bs));

      assert (rs.size () == 3);
      assert (rs[0].package == "vim" && rs[0].success);
      assert (rs[1].package == "typescript" && rs[1].success);
      assert (rs[2].package == "eslint" && !rs[2].success);

      assert ((tb["pacman"].batches == vector<strings> {{"vim"}}));
      assert ((tb["npm"].batches ==
               vector<strings> {{"typescript", "eslint"}}));
    }

    // Rejected password aborts the installation without prompting again
    // for the next batch.
    //
    {
      sudo_session::simulation s;
      s.password = "secret";
      s.answers = {"wrong", "again"};

      sudo_session ss;
      ss.simulate_ = &s;

      test_backends tb (co, {"pacman", "npm"});
      tb["pacman"].add ("htop", "3.3.0-1");
      tb["pacman"].sudo = &ss;
      tb["npm"].add ("@scope/z", "1.0.0");
      tb["npm"].sudo = &ss;

      multi_backend mb (move (tb.managers));

      bool f (false);
      try
      {
        mb.install_auto ({"htop", "@scope/z"});
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
      assert (s.prompts == 1);
      assert (s.commands.empty ());
      assert ((tb["pacman"].batches == vector<strings> {{"htop"}}));
      assert (tb["npm"].batches.empty ());
    }

    // Same for the concurrent update checks.
    //
    {
      sudo_session::simulation s;
      s.password = "secret";
      s.answers = {"wrong", "again"};

      sudo_session ss;
      ss.simulate_ = &s;

      test_backends tb (co, {"pacman", "apt"});
      tb["pacman"].sudo = &ss;
      tb["apt"].sudo = &ss;

      multi_backend mb (move (tb.managers));

      bool f (false);
      try
      {
        mb.check_updates_all ();
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
      assert (s.prompts == 1);
      assert (s.commands.empty ());
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
