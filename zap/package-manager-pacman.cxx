// file      : zap/package-manager-pacman.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-pacman.hxx>

#include <sstream>

#include <zap/pkgbuild.hxx> // clean_dependency_name()
#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  // Search results are truncated to this many packages.
  //
  static const size_t search_limit (30);

  packages package_manager_pacman::
  parse_search (const string& o)
  {
    packages r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      if (l.empty ())
        continue;

      // Description line.
      //
      if (l.front () == ' ')
      {
        if (!r.empty ())
        {
          trim (l);

          optional<string>& d (r.back ().description);
          if (!d)
            d = move (l);
          else if (!l.empty ())
            *d += ' ' + l;
        }

        continue;
      }

      // The <repo>/<name> <version> [(<group>...)] [[installed...]] line.
      //
      size_t b (0), e (0);
      string rn (next_word (l, b, e) != 0 ? string (l, b, e - b) : string ());

      size_t p (rn.find ('/'));
      if (p == string::npos || p == 0 || p + 1 == rn.size ())
        continue;

      package pkg (string (rn, p + 1),
                   next_word (l, b, e) != 0 ? string (l, b, e - b) : string ());

      pkg.extra.repository = string (rn, 0, p);

      for (size_t n; (n = next_word (l, b, e)) != 0; )
      {
        if (l.compare (b, 10, "[installed") == 0)
          pkg.installed = true;
      }

      r.push_back (move (pkg));
    }

    return r;
  }

  optional<package> package_manager_pacman::
  parse_info (const string& o)
  {
    package r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      // Multiple repositories may carry the same package in which case there
      // are several blocks separated with a blank line. Only consider the
      // first one.
      //
      if (l.empty ())
      {
        if (!r.name.empty ())
          break;

        continue;
      }

      // Skip the value continuation lines (Optional Deps, etc).
      //
      if (l.front () == ' ')
        continue;

      size_t p (l.find (':'));
      if (p == string::npos)
        continue;

      string k (l, 0, p);
      string v (l, p + 1);

      trim (k);
      trim (v);

      if (k == "Name")
        r.name = move (v);
      else if (k == "Version")
        r.version = move (v);
      else if (k == "Description")
      {
        if (!v.empty ())
          r.description = move (v);
      }
      else if (k == "Repository")
      {
        if (!v.empty ())
          r.extra.repository = move (v);
      }
      else if (k == "URL")
      {
        if (!v.empty () && v != "None")
          r.url = move (v);
      }
      else if (k == "Packager")
      {
        if (!v.empty () && v != "Unknown Packager")
          r.maintainer = move (v);
      }
      else if (k == "Licenses" || k == "Depends On")
      {
        if (v == "None")
          continue;

        strings& ns (k == "Licenses" ? r.extra.license : r.extra.depends);

        size_t b (0), e (0);
        for (size_t n; (n = next_word (v, b, e)) != 0; )
        {
          string w (v, b, n);

          if (k == "Depends On")
            w = clean_dependency_name (w);

          if (!w.empty ())
            ns.push_back (move (w));
        }
      }
    }

    if (r.name.empty ())
      return nullopt;

    return r;
  }

  strings package_manager_pacman::
  parse_upgrades (const string& o)
  {
    strings r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      size_t b (0), e (0);
      if (next_word (l, b, e) != 0)
        r.push_back (string (l, b, e - b));
    }

    return r;
  }

  installed_packages package_manager_pacman::
  parse_installed (const string& o)
  {
    installed_packages r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      size_t b (0), e (0);

      if (next_word (l, b, e) == 0)
        continue;

      string n (l, b, e - b);

      if (next_word (l, b, e) == 0)
        continue;

      r.emplace_back (move (n), string (l, b, e - b));
    }

    return r;
  }

  packages package_manager_pacman::
  search (const string& q)
  {
    if (q.size () < 2)
      return packages ();

    // Note that pacman exits with non-zero status if nothing matches.
    //
    optional<string> o (capture ({"pacman", "-Ss", q.c_str (), nullptr}));

    if (!o)
      return packages ();

    packages r (parse_search (*o));

    if (r.size () > search_limit)
      r.resize (search_limit);

    return r;
  }

  packages package_manager_pacman::
  info (const strings& ns)
  {
    tracer trace ("package_manager_pacman::info");

    packages r;

    for (const string& n: ns)
    {
      optional<string> o (capture ({"pacman", "-Si", n.c_str (), nullptr}));

      if (!o)
      {
        l4 ([&]{trace << n << " not found";});
        continue;
      }

      if (optional<package> p = parse_info (*o))
      {
        p->installed = is_installed (p->name);
        r.push_back (move (*p));
      }
    }

    return r;
  }

  install_results package_manager_pacman::
  install (const packages& ps)
  {
    install_results r;

    if (ps.empty ())
      return r;

    if (verb == 1)
      text << "installing " << ps.size () << " package(s) with pacman";

    cstrings args {"pacman", "-S", "--noconfirm", "--needed"};

    for (const package& p: ps)
      args.push_back (p.name.c_str ());

    args.push_back (nullptr);

    bool s (sudo_.run (args));

    for (const package& p: ps)
    {
      if (s)
        r.emplace_back (p.name, true);
      else
        r.emplace_back (p.name, false, string ("pacman install failed"));
    }

    return r;
  }

  bool package_manager_pacman::
  is_installed (const string& n)
  {
    return capture ({"pacman", "-Q", n.c_str (), nullptr}).has_value ();
  }

  installed_packages package_manager_pacman::
  list_installed ()
  {
    // Native packages only (the foreign ones are listed by aur).
    //
    optional<string> o (capture ({"pacman", "-Qn", nullptr}));
    return o ? parse_installed (*o) : installed_packages ();
  }

  packages package_manager_pacman::
  check_updates ()
  {
    if (verb == 1)
      text << "synchronizing pacman package databases";

    if (!sudo_.run_output ({"pacman", "-Sy", nullptr}))
      warn << "unable to synchronize pacman package databases";

    // Note that pacman exits with non-zero status if there are no upgrades.
    //
    optional<string> o (capture ({"pacman", "-Qu", nullptr},
                                 true /* ignore_status */));

    strings ns (o ? parse_upgrades (*o) : strings ());
    return ns.empty () ? packages () : info (ns);
  }
}
