// file      : zap/aur-resolve.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/aur-resolve.hxx>

#include <set>

#include <zap/pkgbuild.hxx> // clean_dependency_name()
#include <zap/diagnostics.hxx>

using namespace std;

namespace zap
{
  aur_dependency_source::
  ~aur_dependency_source ()
  {
    // vtable
  }

  packages
  resolve_aur_dependencies (aur_dependency_source& src, const package& root)
  {
    tracer trace ("resolve_aur_dependencies");

    packages r;

    set<string> visited;
    vector<package> stack {root};

    auto found = [&r] (const string& n)
    {
      return find_if (r.begin (), r.end (),
                      [&n] (const package& p) {return p.name == n;}) !=
        r.end ();
    };

    while (!stack.empty ())
    {
      package p (move (stack.back ()));
      stack.pop_back ();

      if (!visited.insert (p.name).second)
        continue;

      strings ds;
      try
      {
        ds = src.descriptor_depends (p);
      }
      catch (const package_error& e)
      {
        warn << "unable to obtain dependencies of " << p.name << ": "
             << e.what () <<
          info << "skipping its dependencies";
        continue;
      }

      for (const string& d: ds)
      {
        string n (clean_dependency_name (d));

        if (n.empty () || n == root.name || found (n))
          continue;

        if (src.installed (n))
        {
          l5 ([&]{trace << n << " is installed";});
          continue;
        }

        if (src.in_primary_repository (n))
        {
          l5 ([&]{trace << n << " is in primary repository";});
          continue;
        }

        optional<package> dp;
        try
        {
          dp = src.community_package (n);
        }
        catch (const package_error& e)
        {
          warn << "unable to query " << n << ": " << e.what ();
          continue;
        }

        if (!dp)
        {
          l4 ([&]{trace << n << " required by " << p.name << " not found";});
          continue;
        }

        l4 ([&]{trace << n << " is required by " << p.name;});

        r.push_back (*dp);
        stack.push_back (move (*dp));
      }
    }

    return r;
  }
}
