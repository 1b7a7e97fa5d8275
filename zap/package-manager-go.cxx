// file      : zap/package-manager-go.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-go.hxx>

#include <sstream>

#include <zap/json.hxx>
#include <zap/fetch.hxx>
#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  using event = json::event;

  optional<string> package_manager_go::
  parse_latest (const string& s)
  {
    // {"Version": "v1.2.3", "Time": "2024-01-02T03:04:05Z", ...}
    //
    optional<string> r;

    try
    {
      istringstream is (s);
      json::parser p (is, "module proxy response");

      p.next_expect (event::begin_object);

      while (p.next_expect (event::name, event::end_object))
      {
        if (p.name () == "Version")
          r = next_json_string (p);
        else
          p.next_expect_value_skip ();
      }
    }
    catch (const json::invalid_json_input& e)
    {
      throw package_error (package_error_kind::parse,
                           string ("invalid module proxy response: ") +
                           e.what ());
    }

    if (r && r->empty ())
      r = nullopt;

    return r;
  }

  string package_manager_go::
  escape_module_path (const string& s)
  {
    string r;

    for (char c: s)
    {
      if (c >= 'A' && c <= 'Z')
      {
        r += '!';
        r += static_cast<char> (c - 'A' + 'a');
      }
      else
        r += c;
    }

    return r;
  }

  string package_manager_go::
  binary_name (const string& s)
  {
    string p (s, 0, s.find ('@'));

    while (!p.empty () && p.back () == '/')
      p.pop_back ();

    size_t i (p.rfind ('/'));
    string r (i != string::npos ? string (p, i + 1) : p);

    // Skip the major version suffix (for example, example.org/tool/v2).
    //
    if (i != string::npos && r.size () > 1 && r[0] == 'v' &&
        all_of (r.begin () + 1, r.end (), [] (char c) {return digit (c);}))
    {
      p.resize (i);

      size_t j (p.rfind ('/'));
      r = j != string::npos ? string (p, j + 1) : p;
    }

    return r;
  }

  dir_paths package_manager_go::
  bin_dirs ()
  {
    dir_paths r;

    auto add = [&r] (const string& d, const char* sub)
    {
      try
      {
        dir_path p (d);

        if (sub != nullptr)
          p /= dir_path (sub);

        if (p.absolute () && find (r.begin (), r.end (), p) == r.end ())
          r.push_back (move (p));
      }
      catch (const invalid_path&)
      {
        // Ignore.
      }
    };

    if (optional<string> v = getenv ("GOBIN"))
    {
      if (!v->empty ())
        add (*v, nullptr);
    }

    // GOPATH is a list of directories with the first one being where go
    // install places binaries.
    //
    if (optional<string> v = getenv ("GOPATH"))
    {
      string f (*v, 0, v->find (':'));
      if (!f.empty ())
        add (f, "bin");
    }

    try
    {
      add ((dir_path::home_directory () / dir_path ("go")).string (), "bin");
    }
    catch (const system_error&)
    {
      // No home directory.
    }

    return r;
  }

  packages package_manager_go::
  search (const string& q)
  {
    if (q.size () < 2)
      return packages ();

    return info (strings {q});
  }

  packages package_manager_go::
  info (const strings& ns)
  {
    tracer trace ("package_manager_go::info");

    packages r;

    for (const string& n: ns)
    {
      string mp (n, 0, n.find ('@'));

      if (mp.empty ())
        continue;

      // The proxy responds with 404/410 to unknown modules.
      //
      string s;
      try
      {
        s = fetch_text (options_,
                        proxy_ + '/' + escape_module_path (mp) + "/@latest");
      }
      catch (const package_error& e)
      {
        l4 ([&]{trace << mp << ": " << e.what ();});
        continue;
      }

      if (optional<string> v = parse_latest (s))
      {
        package p (mp, move (*v));
        p.url = "https://pkg.go.dev/" + mp;
        p.installed = is_installed (mp);
        r.push_back (move (p));
      }
    }

    return r;
  }

  install_results package_manager_go::
  run_install (const packages& ps, bool latest)
  {
    install_results r;

    for (const package& p: ps)
    {
      if (verb == 1)
        text << (latest ? "updating " : "installing ") << p.name
             << " with go install";

      string spec;
      if (latest)
        spec = string (p.name, 0, p.name.find ('@')) + "@latest";
      else if (p.name.find ('@') != string::npos)
        spec = p.name;
      else
        spec = p.name + '@' + (p.version.empty () ? "latest" : p.version);

      if (execute ({"go", "install", spec.c_str (), nullptr}))
        r.emplace_back (p.name, true);
      else
        r.emplace_back (p.name, false, string ("go install failed"));
    }

    return r;
  }

  install_results package_manager_go::
  install (const packages& ps)
  {
    return run_install (ps, false /* latest */);
  }

  install_results package_manager_go::
  update (const packages& ps)
  {
    return run_install (ps, true /* latest */);
  }

  bool package_manager_go::
  is_installed (const string& n)
  {
    string b (binary_name (n));

    for (const dir_path& d: bin_dirs ())
    {
      if (exists (d / path (b), true /* ignore_error */))
        return true;
    }

    return false;
  }

  installed_packages package_manager_go::
  list_installed ()
  {
    installed_packages r;

    for (const dir_path& d: bin_dirs ())
    {
      if (!exists (d, true /* ignore_error */))
        continue;

      try
      {
        for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
        {
          if (de.type () != entry_type::regular)
            continue;

          string n (de.path ().string ());

          if (find_if (r.begin (), r.end (),
                       [&n] (const pair<string, string>& i)
                       {
                         return i.first == n;
                       }) == r.end ())
            r.emplace_back (move (n), "unknown");
        }
      }
      catch (const system_error& e)
      {
        warn << "unable to scan directory " << d << ": " << e;
      }
    }

    return r;
  }

  packages package_manager_go::
  check_updates ()
  {
    return packages ();
  }
}
