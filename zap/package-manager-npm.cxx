// file      : zap/package-manager-npm.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-npm.hxx>

#include <sstream>

#include <zap/json.hxx>
#include <zap/fetch.hxx>
#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  using event = json::event;

  static inline package_error
  invalid_json (const char* what, const json::invalid_json_input& e)
  {
    return package_error (package_error_kind::parse,
                          string ("invalid ") + what + ": " + e.what () +
                          " at line " + to_string (e.line) +
                          ", column " + to_string (e.column));
  }

  // Parse the search result package object:
  //
  // {"name": "...", "version": "...", "description": "...",
  //  "links": {"npm": "...", "homepage": "...", "repository": "..."},
  //  "publisher": {"username": "...", "email": "..."}, ...}
  //
  static void
  parse_search_package (json::parser& p, package& r)
  {
    // enter: before begin_object
    // leave: after end_object

    p.next_expect (event::begin_object);

    optional<string> homepage, npm, repository;
    optional<string> username, email;

    while (p.next_expect (event::name, event::end_object))
    {
      string n (p.name ());

      if (n == "name")
      {
        if (optional<string> v = next_json_string (p))
          r.name = move (*v);
      }
      else if (n == "version")
      {
        if (optional<string> v = next_json_string (p))
          r.version = move (*v);
      }
      else if (n == "description")
        r.description = next_json_string (p);
      else if (n == "links" && peek_json (p, event::begin_object))
      {
        p.next ();

        while (p.next_expect (event::name, event::end_object))
        {
          string l (p.name ());

          if      (l == "homepage")   homepage = next_json_string (p);
          else if (l == "npm")        npm = next_json_string (p);
          else if (l == "repository") repository = next_json_string (p);
          else                        p.next_expect_value_skip ();
        }
      }
      else if (n == "publisher" && peek_json (p, event::begin_object))
      {
        p.next ();

        while (p.next_expect (event::name, event::end_object))
        {
          string l (p.name ());

          if      (l == "username") username = next_json_string (p);
          else if (l == "email")    email = next_json_string (p);
          else                      p.next_expect_value_skip ();
        }
      }
      else
        p.next_expect_value_skip ();
    }

    r.url = homepage ? move (homepage) : npm ? move (npm) : move (repository);
    r.maintainer = username ? move (username) : move (email);
  }

  packages package_manager_npm::
  parse_search (const string& s)
  {
    packages r;

    try
    {
      istringstream is (s);
      json::parser p (is, "npm search response");

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        if (p.name () != "objects")
        {
          p.next_expect_value_skip ();
          continue;
        }

        p.next_expect (event::begin_array);

        while (p.next_expect (event::begin_object, event::end_array))
        {
          package pkg;

          while (p.next_expect (event::name, event::end_object))
          {
            string n (p.name ());

            if (n == "package")
              parse_search_package (p, pkg);
            else if (n == "score" && peek_json (p, event::begin_object))
            {
              // {"final": ..., "detail": {"popularity": ..., ...}}
              //
              p.next ();

              while (p.next_expect (event::name, event::end_object))
              {
                if (p.name () == "detail" && peek_json (p, event::begin_object))
                {
                  p.next ();

                  while (p.next_expect (event::name, event::end_object))
                  {
                    if (p.name () == "popularity")
                    {
                      if (optional<double> v = next_json_double (p))
                        pkg.popularity = *v * 100;
                    }
                    else
                      p.next_expect_value_skip ();
                  }
                }
                else
                  p.next_expect_value_skip ();
              }
            }
            else
              p.next_expect_value_skip ();
          }

          if (!pkg.name.empty ())
            r.push_back (move (pkg));
        }
      }
    }
    catch (const json::invalid_json_input& e)
    {
      throw invalid_json ("npm search response", e);
    }

    return r;
  }

  optional<package> package_manager_npm::
  parse_manifest (const string& s)
  {
    package r;

    try
    {
      istringstream is (s);
      json::parser p (is, "npm package manifest");

      optional<string> homepage, repository;

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        string n (p.name ());

        if (n == "name")
        {
          if (optional<string> v = next_json_string (p))
            r.name = move (*v);
        }
        else if (n == "version")
        {
          if (optional<string> v = next_json_string (p))
            r.version = move (*v);
        }
        else if (n == "description")
          r.description = next_json_string (p);
        else if (n == "homepage")
          homepage = next_json_string (p);
        else if (n == "license")
        {
          if (optional<string> v = next_json_string (p))
            r.extra.license.push_back (move (*v));
        }
        else if (n == "repository")
        {
          // Either a string or {"type": "git", "url": "..."}.
          //
          if (peek_json (p, event::begin_object))
          {
            p.next ();

            while (p.next_expect (event::name, event::end_object))
            {
              if (p.name () == "url")
                repository = next_json_string (p);
              else
                p.next_expect_value_skip ();
            }
          }
          else
            repository = next_json_string (p);
        }
        else if (n == "dependencies" && peek_json (p, event::begin_object))
        {
          p.next ();

          while (p.next_expect (event::name, event::end_object))
          {
            r.extra.depends.push_back (p.name ());
            p.next_expect_value_skip ();
          }
        }
        else if (n == "maintainers" && peek_json (p, event::begin_array))
        {
          // [{"name": "...", "email": "..."}, ...]
          //
          p.next ();

          while (p.next_expect (event::begin_object, event::end_array))
          {
            while (p.next_expect (event::name, event::end_object))
            {
              if (p.name () == "name" && !r.maintainer)
                r.maintainer = next_json_string (p);
              else
                p.next_expect_value_skip ();
            }
          }
        }
        else
          p.next_expect_value_skip ();
      }

      if (r.name.empty () || r.version.empty ())
        return nullopt;

      if (homepage)
        r.url = move (homepage);
      else if (repository)
        r.url = move (repository);
      else
        r.url = "https://www.npmjs.com/package/" + r.name;
    }
    catch (const json::invalid_json_input& e)
    {
      throw invalid_json ("npm package manifest", e);
    }

    return r;
  }

  installed_packages package_manager_npm::
  parse_list (const string& s)
  {
    // {"version": "...", "name": "lib",
    //  "dependencies": {"<name>": {"version": "..."}, ...}}
    //
    installed_packages r;

    try
    {
      istringstream is (s);
      json::parser p (is, "npm list output");

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        if (p.name () != "dependencies" || !peek_json (p, event::begin_object))
        {
          p.next_expect_value_skip ();
          continue;
        }

        p.next ();

        while (p.next_expect (event::name, event::end_object))
        {
          string n (p.name ());

          if (!peek_json (p, event::begin_object))
          {
            p.next_expect_value_skip ();
            continue;
          }

          p.next ();

          optional<string> v;
          while (p.next_expect (event::name, event::end_object))
          {
            if (p.name () == "version")
              v = next_json_string (p);
            else
              p.next_expect_value_skip ();
          }

          if (v)
            r.emplace_back (move (n), move (*v));
        }
      }
    }
    catch (const json::invalid_json_input& e)
    {
      throw invalid_json ("npm list output", e);
    }

    return r;
  }

  packages package_manager_npm::
  parse_outdated (const string& s)
  {
    // {"<name>": {"current": "...", "wanted": "...", "latest": "...", ...},
    //  ...}
    //
    // Note that npm prints nothing if everything is up to date.
    //
    packages r;

    string t (s);
    if (trim (t).empty ())
      return r;

    try
    {
      istringstream is (t);
      json::parser p (is, "npm outdated output");

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        string n (p.name ());

        if (!peek_json (p, event::begin_object))
        {
          p.next_expect_value_skip ();
          continue;
        }

        p.next ();

        optional<string> v;
        while (p.next_expect (event::name, event::end_object))
        {
          if (p.name () == "latest")
            v = next_json_string (p);
          else
            p.next_expect_value_skip ();
        }

        if (v)
        {
          package pkg (move (n), move (*v));
          pkg.installed = true;
          r.push_back (move (pkg));
        }
      }
    }
    catch (const json::invalid_json_input& e)
    {
      throw invalid_json ("npm outdated output", e);
    }

    return r;
  }

  packages package_manager_npm::
  search (const string& q)
  {
    if (q.size () < 2)
      return packages ();

    packages r (
      parse_search (
        fetch_text (options_,
                    registry_ + "/-/v1/search?text=" + url_encode (q) +
                    "&size=25")));

    if (!r.empty ())
    {
      installed_packages is (list_installed ());

      for (package& p: r)
      {
        p.installed = find_if (is.begin (), is.end (),
                               [&p] (const pair<string, string>& i)
                               {
                                 return i.first == p.name;
                               }) != is.end ();
      }
    }

    return r;
  }

  packages package_manager_npm::
  info (const strings& ns)
  {
    tracer trace ("package_manager_npm::info");

    packages r;

    for (const string& n: ns)
    {
      // Note that the registry responds with 404 to unknown names which the
      // fetch program reports the same way as any other failure.
      //
      string m;
      try
      {
        m = fetch_text (options_,
                        registry_ + '/' + url_encode (n, false) + "/latest");
      }
      catch (const package_error& e)
      {
        l4 ([&]{trace << n << ": " << e.what ();});
        continue;
      }

      if (optional<package> p = parse_manifest (m))
      {
        p->installed = is_installed (p->name);
        r.push_back (move (*p));
      }
    }

    return r;
  }

  install_results package_manager_npm::
  run_install (const char* c, const packages& ps)
  {
    install_results r;

    if (ps.empty ())
      return r;

    if (verb == 1)
      text << (strcmp (c, "install") == 0 ? "installing " : "updating ")
           << ps.size () << " package(s) with npm";

    cstrings args {"npm", c, "-g"};

    for (const package& p: ps)
      args.push_back (p.name.c_str ());

    args.push_back (nullptr);

    bool s (execute (args));

    for (const package& p: ps)
    {
      if (s)
        r.emplace_back (p.name, true);
      else
        r.emplace_back (p.name, false, string ("npm ") + c + " failed");
    }

    return r;
  }

  install_results package_manager_npm::
  install (const packages& ps)
  {
    return run_install ("install", ps);
  }

  install_results package_manager_npm::
  update (const packages& ps)
  {
    return run_install ("update", ps);
  }

  bool package_manager_npm::
  is_installed (const string& n)
  {
    installed_packages is (list_installed ());

    return find_if (is.begin (), is.end (),
                    [&n] (const pair<string, string>& i)
                    {
                      return i.first == n;
                    }) != is.end ();
  }

  installed_packages package_manager_npm::
  list_installed ()
  {
    // Note that npm exits with non-zero status if there are problems with
    // the installed tree (missing peer dependencies, etc) while still
    // printing the list.
    //
    optional<string> o (
      capture ({"npm", "list", "-g", "--depth", "0", "--json", nullptr},
               true /* ignore_status */));

    if (!o || o->empty ())
      return installed_packages ();

    return parse_list (*o);
  }

  packages package_manager_npm::
  check_updates ()
  {
    // Note that npm outdated exits with status 1 if anything is outdated.
    //
    optional<string> o (
      capture ({"npm", "outdated", "-g", "--json", nullptr},
               true /* ignore_status */));

    return o ? parse_outdated (*o) : packages ();
  }
}
