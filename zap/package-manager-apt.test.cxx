// file      : zap/package-manager-apt.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-apt.hxx>

#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  using pm = package_manager_apt;

  static const char policy[] =
    "libcurl4:\n"
    "  Installed: 7.81.0-1ubuntu1.15\n"
    "  Candidate: 7.81.0-1ubuntu1.16\n"
    "  Version table:\n"
    "     7.81.0-1ubuntu1.16 500\n"
    "        500 http://archive.ubuntu.com/ubuntu jammy-updates/main amd64 "
    "Packages\n"
    " *** 7.81.0-1ubuntu1.15 100\n"
    "        100 /var/lib/dpkg/status\n"
    "curl:\n"
    "  Installed: (none)\n"
    "  Candidate: 7.81.0-1ubuntu1.16\n"
    "  Version table:\n"
    "     7.81.0-1ubuntu1.16 500\n";

  static const char show[] =
    "Package: curl\n"
    "Version: 7.81.0-1ubuntu1.16\n"
    "Priority: optional\n"
    "Section: web\n"
    "Maintainer: Ubuntu Developers <ubuntu-devel-discuss@lists.ubuntu.com>\n"
    "Depends: libc6 (>= 2.34), libcurl4 (= 7.81.0-1ubuntu1.16), "
    "zlib1g (>= 1:1.1.4), foo | bar\n"
    "Homepage: https://curl.haxx.se\n"
    "Description: command line tool for transferring data with URL syntax\n"
    " This is a command line tool for transferring data with URL syntax.\n"
    "\n"
    "Package: curl\n"
    "Version: 7.81.0-1\n"
    "\n";

  int
  main ()
  {
    verb = 0;

    {
      packages ps (pm::parse_search (
        "curl - command line tool for transferring data with URL syntax\n"
        "libcurl4 - easy-to-use client-side URL transfer library\n"
        "bogus line\n"));

      assert (ps.size () == 2);
      assert (ps[0].name == "curl" && ps[0].version.empty ());
      assert (*ps[1].description == "easy-to-use client-side URL transfer "
              "library");
    }

    {
      pm::policies ps (pm::parse_policy (policy));

      assert (ps.size () == 2);
      assert (ps["libcurl4"].installed == "7.81.0-1ubuntu1.15");
      assert (ps["libcurl4"].candidate == "7.81.0-1ubuntu1.16");
      assert (ps["curl"].installed.empty ());

      try
      {
        pm::parse_policy ("  Installed: 1.0\n");
        assert (false);
      }
      catch (const package_error& e)
      {
        assert (e.kind == package_error_kind::parse);
      }
    }

    {
      optional<package> p (pm::parse_show (show));

      assert (p);
      assert (p->name == "curl" && p->version == "7.81.0-1ubuntu1.16");
      assert (*p->extra.repository == "web");
      assert (*p->url == "https://curl.haxx.se");
      assert (p->maintainer->find ("Ubuntu Developers") == 0);
      assert (*p->description ==
              "command line tool for transferring data with URL syntax");
      assert ((p->extra.depends ==
               strings {"libc6", "libcurl4", "zlib1g", "foo"}));

      assert (!pm::parse_show (""));
    }

    assert ((pm::parse_upgradable (
               "Listing...\n"
               "curl/jammy-updates 7.81.0-1ubuntu1.16 amd64 [upgradable from: "
               "7.81.0-1ubuntu1.15]\n")
             == strings {"curl"}));

    // Search fills in the versions and installed flags with one policy
    // query.
    //
    {
      common_options co;
      sudo_session sudo;

      package_manager::simulation s;
      s.output[{"apt-cache", "search", "curl"}] =
        "curl - command line tool\n"
        "libcurl4 - client-side URL transfer library\n";
      s.output[{"apt-cache", "policy", "--quiet", "curl", "libcurl4"}] =
        policy;

      package_manager_apt p (co, sudo);
      p.simulate_ = &s;

      packages ps (p.search ("curl"));

      assert (ps.size () == 2);
      assert (ps[0].version == "7.81.0-1ubuntu1.16" && !ps[0].installed);
      assert (ps[1].installed);
      assert (s.commands.size () == 2);
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
