// file      : zap/aur-resolve.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/aur-resolve.hxx>

#include <map>
#include <set>

#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  // Dependency source with the descriptors and the registry contents
  // specified upfront.
  //
  class test_source: public aur_dependency_source
  {
  public:
    std::map<string, strings> descriptors; // Absent means fetch failure.
    std::set<string> installed_names;
    std::set<string> primary_names;
    std::set<string> community_names;
    std::set<string> query_failures;

    strings fetched;

    virtual strings
    descriptor_depends (const package& p) override
    {
      fetched.push_back (p.name);

      auto i (descriptors.find (p.name));
      if (i == descriptors.end ())
        throw package_error (package_error_kind::network,
                             "unable to fetch " + p.name);

      return i->second;
    }

    virtual bool
    installed (const string& n) override
    {
      return installed_names.find (n) != installed_names.end ();
    }

    virtual bool
    in_primary_repository (const string& n) override
    {
      return primary_names.find (n) != primary_names.end ();
    }

    virtual optional<package>
    community_package (const string& n) override
    {
      if (query_failures.find (n) != query_failures.end ())
        throw package_error (package_error_kind::network, "timeout");

      if (community_names.find (n) == community_names.end ())
        return nullopt;

      package p (n, "1.0-1");
      p.extra.url_path = "/cgit/aur.git/snapshot/" + n + ".tar.gz";
      return p;
    }
  };

  static strings
  names (const packages& ps)
  {
    strings r;
    for (const package& p: ps)
      r.push_back (p.name);
    return r;
  }

  int
  main ()
  {
    verb = 0;

    // Cycles terminate without duplicates and the root is never included.
    //
    {
      test_source s;
      s.community_names = {"a", "b", "c"};
      s.descriptors["root"] = {"a"};
      s.descriptors["a"] = {"b", "root"};
      s.descriptors["b"] = {"c", "a"};
      s.descriptors["c"] = {"a>=1.0", "b"};

      packages r (resolve_aur_dependencies (s, package ("root", "1")));

      assert ((names (r) == strings {"a", "b", "c"}));
      assert ((s.fetched == strings {"root", "a", "b", "c"}));
    }

    // Self-dependency.
    //
    {
      test_source s;
      s.descriptors["root"] = {"root"};

      assert (resolve_aur_dependencies (s, package ("root", "1")).empty ());
    }

    // Installed and primary repository packages are excluded, the version
    // constraints are stripped, and unknown names are skipped.
    //
    {
      test_source s;
      s.installed_names = {"glibc"};
      s.primary_names = {"cmake", "libfoo"};
      s.community_names = {"libfoo", "libbar"};
      s.descriptors["root"] = {"glibc>=2.38", "cmake", "libfoo=1.2",
                               "libbar<3", "nosuch"};
      s.descriptors["libbar"] = {};

      packages r (resolve_aur_dependencies (s, package ("root", "1")));

      assert ((names (r) == strings {"libbar"}));
      assert (r[0].extra.url_path);
    }

    // Discovery order: the direct dependencies first, then the ones of the
    // most recently discovered package.
    //
    {
      test_source s;
      s.community_names = {"a", "b", "a1", "b1"};
      s.descriptors["root"] = {"a", "b"};
      s.descriptors["a"] = {"a1"};
      s.descriptors["b"] = {"b1"};
      s.descriptors["a1"] = {};
      s.descriptors["b1"] = {};

      packages r (resolve_aur_dependencies (s, package ("root", "1")));

      assert ((names (r) == strings {"a", "b", "b1", "a1"}));
    }

    // A descriptor failure only prunes that branch and a registry query
    // failure only skips that name.
    //
    {
      test_source s;
      s.community_names = {"a", "b", "a1", "b1", "c"};
      s.query_failures = {"c"};
      s.descriptors["root"] = {"a", "b", "c"};
      s.descriptors["b"] = {"b1"};       // a fails to fetch.
      s.descriptors["b1"] = {};

      packages r (resolve_aur_dependencies (s, package ("root", "1")));

      assert ((names (r) == strings {"a", "b", "b1"}));
    }

    // Root descriptor failure yields no dependencies.
    //
    {
      test_source s;
      assert (resolve_aur_dependencies (s, package ("root", "1")).empty ());
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
