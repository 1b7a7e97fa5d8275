// file      : zap/package-manager-aur.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-aur.hxx>

#include <sstream>

#include <zap/json.hxx>
#include <zap/fetch.hxx>
#include <zap/pkgbuild.hxx>
#include <zap/diagnostics.hxx>

#include <zap/package-manager-pacman.hxx> // parse_installed()

using namespace std;
using namespace butl;

namespace zap
{
  using event = json::event;

  static const size_t search_limit (30);

  // Official repositories for in_primary_repository().
  //
  static const char* primary_repositories[] = {
    "core", "extra", "community", "multilib"};

  package_manager_aur::
  package_manager_aur (const common_options& co, sudo_session& s)
      : package_manager_aur (co, s, aur_build_dir (co))
  {
  }

  package_manager_aur::
  package_manager_aur (const common_options& co,
                       sudo_session& s,
                       dir_path scratch)
      : package_manager (co),
        builder_ (co, s, move (scratch)),
        rpc_url_ (co.aur_url () + "/rpc/v5")
  {
  }

  // Parse the result object:
  //
  // {"ID": 1, "Name": "yay", "Version": "12.3.5-1", "Description": "...",
  //  "NumVotes": 2000, "Popularity": 25.5, "Maintainer": "...",
  //  "URL": "...", "URLPath": "/cgit/aur.git/snapshot/yay.tar.gz",
  //  "OutOfDate": null, "Depends": [...], "License": [...], ...}
  //
  static package
  parse_result (json::parser& p)
  {
    // enter: after begin_object
    // leave: after end_object

    package r;

    while (p.next_expect (event::name, event::end_object))
    {
      string n (p.name ());

      if (n == "Name")
      {
        if (optional<string> v = next_json_string (p))
          r.name = move (*v);
      }
      else if (n == "Version")
      {
        if (optional<string> v = next_json_string (p))
          r.version = move (*v);
      }
      else if (n == "Description") r.description = next_json_string (p);
      else if (n == "Maintainer")  r.maintainer = next_json_string (p);
      else if (n == "URL")         r.url = next_json_string (p);
      else if (n == "ID")          r.extra.aur_id = next_json_uint (p);
      else if (n == "NumVotes")    r.extra.aur_votes = next_json_uint (p);
      else if (n == "URLPath")     r.extra.url_path = next_json_string (p);
      else if (n == "OutOfDate")   r.extra.out_of_date = next_json_uint (p);
      else if (n == "Depends")     r.extra.depends = next_json_strings (p);
      else if (n == "License")     r.extra.license = next_json_strings (p);
      else if (n == "Popularity")
      {
        if (optional<double> v = next_json_double (p))
          r.popularity = *v;
      }
      else
        p.next_expect_value_skip ();
    }

    r.extra.repository = "aur";
    return r;
  }

  package_manager_aur::rpc_response package_manager_aur::
  parse_rpc (const string& s)
  {
    rpc_response r;

    try
    {
      istringstream is (s);
      json::parser p (is, "AUR RPC response");

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        string n (p.name ());

        if (n == "error")
          r.error = next_json_string (p);
        else if (n == "results" && peek_json (p, event::begin_array))
        {
          p.next ();

          while (p.next_expect (event::begin_object, event::end_array))
          {
            package pkg (parse_result (p));

            if (!pkg.name.empty ())
              r.results.push_back (move (pkg));
          }
        }
        else
          p.next_expect_value_skip ();
      }
    }
    catch (const json::invalid_json_input& e)
    {
      throw package_error (package_error_kind::parse,
                           string ("invalid AUR RPC response: ") + e.what () +
                           " at line " + to_string (e.line) +
                           ", column " + to_string (e.column));
    }

    return r;
  }

  bool package_manager_aur::
  parse_primary (const string& o, const string& n)
  {
    // extra/vim 9.1.0-1 [installed]
    //     Vi Improved, a highly configurable, improved version of the vi...
    //
    istringstream is (o);
    for (string l; getline (is, l); )
    {
      if (l.empty () || l.front () == ' ')
        continue;

      size_t b (0), e (0);
      if (next_word (l, b, e) == 0)
        continue;

      string rn (l, b, e - b);
      size_t p (rn.find ('/'));

      if (p == string::npos || rn.compare (p + 1, string::npos, n) != 0)
        continue;

      for (const char* r: primary_repositories)
      {
        if (rn.compare (0, p, r) == 0)
          return true;
      }
    }

    return false;
  }

  package_manager_aur::rpc_response package_manager_aur::
  rpc (const string& u)
  {
    tracer trace ("package_manager_aur::rpc");

    l4 ([&]{trace << u;});

    if (simulate_rpc_ != nullptr)
    {
      auto i (simulate_rpc_->find (u));

      if (i == simulate_rpc_->end ())
        throw package_error (package_error_kind::network,
                             "unable to fetch URL: exit code 22");

      return parse_rpc (i->second);
    }

    return parse_rpc (fetch_text (options_, u));
  }

  packages package_manager_aur::
  search (const string& q)
  {
    if (q.size () < 2)
      return packages ();

    string u (rpc_url_ + "/search/" + url_encode (q, false) + "?by=");

    // Search by name first and if nothing is found, then by name and
    // description. The registry refuses queries that match too many
    // packages.
    //
    rpc_response rs (rpc (u + "name"));

    if (rs.error || rs.results.empty ())
      rs = rpc (u + "name-desc");

    if (rs.error)
    {
      if (rs.error->find ("Too many") != string::npos)
        return packages ();

      throw package_error (package_error_kind::network,
                           "AUR RPC error: " + *rs.error);
    }

    packages& r (rs.results);

    stable_sort (r.begin (), r.end (),
                 [] (const package& x, const package& y)
                 {
                   return x.popularity > y.popularity;
                 });

    if (r.size () > search_limit)
      r.resize (search_limit);

    return move (r);
  }

  packages package_manager_aur::
  info (const strings& ns)
  {
    if (ns.empty ())
      return packages ();

    // Note that the brackets are percent-encoded since curl treats them as
    // a glob range.
    //
    string u (rpc_url_ + "/info?");

    for (size_t i (0); i != ns.size (); ++i)
    {
      if (i != 0)
        u += '&';

      u += "arg%5B%5D=";
      u += url_encode (ns[i]);
    }

    rpc_response rs (rpc (u));

    if (rs.error)
      throw package_error (package_error_kind::network,
                           "AUR RPC error: " + *rs.error);

    return move (rs.results);
  }

  install_result package_manager_aur::
  install_one (const package& p)
  {
    if (is_installed (p.name))
      return install_result (p.name, true, string ("already installed"));

    if (verb == 1)
      text << "resolving dependencies of " << p.name;

    packages ds (resolve_aur_dependencies (*this, p));

    // Install the dependencies in the reverse discovery order so that the
    // deeper ones come first.
    //
    size_t f (0);
    for (const package& d: reverse_iterate (ds))
    {
      if (is_installed (d.name))
        continue;

      if (verb == 1)
        text << "installing dependency " << d.name << " of " << p.name;

      try
      {
        builder_.build (d);
      }
      catch (const package_error& e)
      {
        warn << "unable to install dependency " << d.name << " of "
             << p.name << ": " << e.what ();
        ++f;
      }
    }

    if (f != 0)
      warn << f << " dependencies of " << p.name << " failed to install" <<
        info << "trying to install " << p.name << " anyway";

    if (verb == 1)
      text << "building " << p.name;

    try
    {
      builder_.build (p);
      return install_result (p.name, true);
    }
    catch (const package_error& e)
    {
      return install_result (p.name, false,
                             to_string (e.kind) + ": " + e.what ());
    }
  }

  install_results package_manager_aur::
  install (const packages& ps)
  {
    install_results r;

    for (const package& p: ps)
    {
      // A failure to resolve is specific to this package.
      //
      try
      {
        r.push_back (install_one (p));
      }
      catch (const package_error& e)
      {
        r.emplace_back (p.name,
                        false,
                        to_string (e.kind) + ": " + e.what ());
      }
    }

    return r;
  }

  bool package_manager_aur::
  is_installed (const string& n)
  {
    return capture ({"pacman", "-Q", n.c_str (), nullptr}).has_value ();
  }

  installed_packages package_manager_aur::
  list_installed ()
  {
    optional<string> o (capture ({"pacman", "-Qm", nullptr}));

    return o
      ? package_manager_pacman::parse_installed (*o)
      : installed_packages ();
  }

  packages package_manager_aur::
  check_updates ()
  {
    installed_packages is (list_installed ());

    if (is.empty ())
      return packages ();

    strings ns;
    for (const pair<string, string>& i: is)
      ns.push_back (i.first);

    packages r;
    for (package& p: info (ns))
    {
      auto i (find_if (is.begin (), is.end (),
                       [&p] (const pair<string, string>& i)
                       {
                         return i.first == p.name;
                       }));

      if (i != is.end () && i->second != p.version)
      {
        p.installed = true;
        r.push_back (move (p));
      }
    }

    return r;
  }

  strings package_manager_aur::
  descriptor_depends (const package& p)
  {
    dir_path d (builder_.fetch (p));
    return read_pkgbuild_depends (d / path ("PKGBUILD"));
  }

  bool package_manager_aur::
  installed (const string& n)
  {
    return is_installed (n);
  }

  bool package_manager_aur::
  in_primary_repository (const string& n)
  {
    // Search for the exact name escaping the regex special characters (for
    // example, gtk+ or libc++).
    //
    string re ("^");
    for (char c: n)
    {
      if (strchr ("\\^$.|?*+()[]{}", c) != nullptr)
        re += '\\';

      re += c;
    }
    re += '$';

    optional<string> o (capture ({"pacman", "-Ss", re.c_str (), nullptr}));
    return o && parse_primary (*o, n);
  }

  optional<package> package_manager_aur::
  community_package (const string& n)
  {
    for (package& p: info (strings {n}))
    {
      if (p.name == n)
        return move (p);
    }

    return nullopt;
  }
}
