// file      : zap/package-manager-apt.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-apt.hxx>

#include <sstream>

#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  static const size_t search_limit (30);

  packages package_manager_apt::
  parse_search (const string& o)
  {
    packages r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      size_t p (l.find (" - "));
      if (p == string::npos)
        continue;

      string n (l, 0, p);
      string d (l, p + 3);

      trim (n);
      trim (d);

      if (n.empty ())
        continue;

      package pkg (move (n), string ());

      if (!d.empty ())
        pkg.description = move (d);

      r.push_back (move (pkg));
    }

    return r;
  }

  package_manager_apt::policies package_manager_apt::
  parse_policy (const string& o)
  {
    // The output is a sequence of blocks in the following form:
    //
    // <pkg>:
    //   Installed: 1.2.3-1
    //   Candidate: 1.3.0-2
    //   Version table:
    //     <...>
    //
    // Where <...> are further lines indented with at least one space.
    //
    policies r;

    istringstream is (o);
    policy* p (nullptr);

    for (string l; getline (is, l); )
    {
      if (l.empty ())
        continue;

      if (l.front () != ' ')
      {
        if (l.back () != ':')
          throw package_error (package_error_kind::parse,
                               "expected package name instead of '" + l +
                               "' in apt-cache policy output");

        l.pop_back ();
        p = &r[l];
        continue;
      }

      if (p == nullptr)
        throw package_error (package_error_kind::parse,
                             "expected package name in apt-cache policy "
                             "output");

      trim (l);

      auto value = [&l] (const char* k) -> optional<string>
      {
        size_t n (strlen (k));

        if (l.compare (0, n, k) != 0 || l.size () == n || l[n] != ':')
          return nullopt;

        string v (l, n + 1);
        trim (v);
        return v == "(none)" ? string () : move (v);
      };

      if (optional<string> i = value ("Installed"))
        p->installed = move (*i);
      else if (optional<string> c = value ("Candidate"))
        p->candidate = move (*c);
    }

    return r;
  }

  optional<package> package_manager_apt::
  parse_show (const string& o)
  {
    package r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      // Paragraphs for several versions are separated with a blank line.
      // The first one is the candidate.
      //
      if (l.empty ())
      {
        if (!r.name.empty ())
          break;

        continue;
      }

      // Skip the multi-line field continuations (long description, etc).
      //
      if (l.front () == ' ' || l.front () == '\t')
        continue;

      size_t p (l.find (':'));
      if (p == string::npos)
        continue;

      string k (l, 0, p);
      string v (l, p + 1);
      trim (v);

      if      (k == "Package")    r.name = move (v);
      else if (k == "Version")    r.version = move (v);
      else if (k == "Maintainer") r.maintainer = move (v);
      else if (k == "Homepage")   r.url = move (v);
      else if (k == "Section")    r.extra.repository = move (v);
      else if (k == "Description")
      {
        if (!v.empty ())
          r.description = move (v);
      }
      else if (k == "Depends")
      {
        // For example:
        //
        // libc6 (>= 2.34), libtinfo6 (>= 6), foo | bar
        //
        // Only take the first alternative, without the version constraint.
        //
        istringstream ds (v);
        for (string d; getline (ds, d, ','); )
        {
          size_t b (0), e (0);
          if (next_word (d, b, e) != 0)
            r.extra.depends.push_back (string (d, b, e - b));
        }
      }
    }

    if (r.name.empty ())
      return nullopt;

    return r;
  }

  strings package_manager_apt::
  parse_upgradable (const string& o)
  {
    // Listing...
    // <pkg>/<suite> <version> <arch> [upgradable from: <version>]
    //
    strings r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      size_t p (l.find ('/'));
      if (p == string::npos || p == 0 || l.find (' ') < p)
        continue;

      r.push_back (string (l, 0, p));
    }

    return r;
  }

  package_manager_apt::policies package_manager_apt::
  apt_cache_policy (const strings& ns)
  {
    // The --quiet option makes sure we don't get a notice printed to stderr
    // if the package is unknown.
    //
    cstrings args {"apt-cache", "policy", "--quiet"};

    for (const string& n: ns)
      args.push_back (n.c_str ());

    args.push_back (nullptr);

    optional<string> o (capture (args));

    if (!o)
      throw package_error (package_error_kind::parse,
                           "apt-cache policy exited with non-zero code");

    return parse_policy (*o);
  }

  packages package_manager_apt::
  search (const string& q)
  {
    if (q.size () < 2)
      return packages ();

    optional<string> o (capture ({"apt-cache", "search", q.c_str (), nullptr}));

    if (!o)
      throw package_error (package_error_kind::parse,
                           "apt-cache search exited with non-zero code");

    packages r (parse_search (*o));

    if (r.size () > search_limit)
      r.resize (search_limit);

    if (r.empty ())
      return r;

    // Fill in the versions and installed flags with a single query.
    //
    strings ns;
    for (const package& p: r)
      ns.push_back (p.name);

    policies ps (apt_cache_policy (ns));

    for (package& p: r)
    {
      auto i (ps.find (p.name));
      if (i != ps.end ())
      {
        p.version = i->second.candidate;
        p.installed = !i->second.installed.empty ();
      }
    }

    return r;
  }

  packages package_manager_apt::
  info (const strings& ns)
  {
    packages r;

    for (const string& n: ns)
    {
      optional<string> o (
        capture ({"apt-cache", "show", "--quiet", n.c_str (), nullptr}));

      if (!o)
        continue;

      if (optional<package> p = parse_show (*o))
      {
        p->installed = is_installed (p->name);
        r.push_back (move (*p));
      }
    }

    return r;
  }

  install_results package_manager_apt::
  install (const packages& ps)
  {
    install_results r;

    if (ps.empty ())
      return r;

    if (verb == 1)
      text << "installing " << ps.size () << " package(s) with apt";

    cstrings args {"apt-get", "install", "--quiet", "--assume-yes"};

    for (const package& p: ps)
      args.push_back (p.name.c_str ());

    args.push_back (nullptr);

    bool s (sudo_.run (args));

    for (const package& p: ps)
    {
      if (s)
        r.emplace_back (p.name, true);
      else
        r.emplace_back (p.name, false, string ("apt install failed"));
    }

    return r;
  }

  bool package_manager_apt::
  is_installed (const string& n)
  {
    return capture ({"dpkg", "-s", n.c_str (), nullptr}).has_value ();
  }

  installed_packages package_manager_apt::
  list_installed ()
  {
    optional<string> o (
      capture ({"dpkg-query", "-W", "-f=${Package} ${Version}\n", nullptr}));

    installed_packages r;

    if (!o)
      return r;

    istringstream is (*o);
    for (string l; getline (is, l); )
    {
      size_t p (l.find (' '));
      if (p != string::npos && p != 0 && p + 1 != l.size ())
        r.emplace_back (string (l, 0, p), string (l, p + 1));
    }

    return r;
  }

  packages package_manager_apt::
  check_updates ()
  {
    if (verb == 1)
      text << "updating apt package lists";

    if (!sudo_.run_output ({"apt-get", "update", "--quiet", nullptr}))
      warn << "unable to update apt package lists";

    optional<string> o (capture ({"apt", "list", "--upgradable", nullptr}));

    strings ns (o ? parse_upgradable (*o) : strings ());
    return ns.empty () ? packages () : info (ns);
  }
}
