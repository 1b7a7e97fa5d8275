// file      : zap/multi-backend.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/multi-backend.hxx>

#include <future>

#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  static const char* primary_backends[] = {
    "pacman", "apt", "dnf", "zypper", "pkg", "brew", "winget", "scoop",
    "choco"};

  static const char* universal_backends[] = {"flatpak", "snap"};

  static const char* community_backends[] = {"aur"};

  static const char* ecosystem_backends[] = {
    "npm", "deno", "pip", "cargo", "go", "pub"};

  strings
  candidate_backends (package_type t, const strings& registered)
  {
    strings r;

    auto add = [&r, &registered] (const char* id)
    {
      if (find (registered.begin (), registered.end (), id) !=
          registered.end () &&
          find (r.begin (), r.end (), id) == r.end ())
        r.push_back (id);
    };

    switch (t)
    {
    case package_type::npm:   add ("npm"); add ("deno"); break;
    case package_type::pip:   add ("pip");               break;
    case package_type::cargo: add ("cargo");             break;
    case package_type::go:    add ("go");                break;
    case package_type::system:
    case package_type::unknown:                          break;
    }

    for (const char* id: primary_backends)   add (id);
    for (const char* id: universal_backends) add (id);
    for (const char* id: community_backends) add (id);
    for (const char* id: ecosystem_backends) add (id);

    return r;
  }

  multi_backend::
  multi_backend (package_managers pms)
      : managers_ (move (pms))
  {
  }

  strings multi_backend::
  ids () const
  {
    strings r;
    for (const unique_ptr<package_manager>& pm: managers_)
      r.push_back (pm->id ());
    return r;
  }

  template <typename F>
  backend_packages_list multi_backend::
  query_all (const char* what, const F& f)
  {
    tracer trace ("multi_backend::query_all");

    vector<future<packages>> fs;
    fs.reserve (managers_.size ());

    for (const unique_ptr<package_manager>& pm: managers_)
    {
      package_manager* m (pm.get ());
      fs.push_back (async (launch::async, [&f, m] () {return f (*m);}));
    }

    // Join all of them, in order, even if some fail. A failure other than
    // the backend's own (for example, no privileges) is propagated once all
    // the tasks are done.
    //
    backend_packages_list r;
    optional<failed> ff;

    for (size_t i (0); i != fs.size (); ++i)
    {
      package_manager* m (managers_[i].get ());

      try
      {
        packages ps (fs[i].get ());

        if (!ps.empty ())
          r.push_back (backend_packages {m, move (ps)});
      }
      catch (const package_error& e)
      {
        l4 ([&]{trace << m->id () << ' ' << what << " failed: "
                      << e.what ();});
      }
      catch (const failed& e)
      {
        if (!ff)
          ff = e;
      }
    }

    if (ff)
      throw *ff; // Diagnostics has already been issued.

    return r;
  }

  backend_packages_list multi_backend::
  search_all (const string& q)
  {
    return query_all ("search",
                      [&q] (package_manager& pm) {return pm.search (q);});
  }

  backend_packages_list multi_backend::
  info_all (const string& n)
  {
    return query_all ("info",
                      [&n] (package_manager& pm)
                      {
                        return pm.info (strings {n});
                      });
  }

  backend_packages_list multi_backend::
  check_updates_all ()
  {
    return query_all ("update check",
                      [] (package_manager& pm) {return pm.check_updates ();});
  }

  install_results multi_backend::
  update_all (const backend_packages_list& bs)
  {
    install_results r;

    for (const backend_packages& b: bs)
    {
      if (b.result.empty ())
        continue;

      if (verb == 1)
        text << "updating " << b.result.size () << " package(s) via "
             << b.manager->name ();

      optional<string> err;
      try
      {
        install_results rs (b.manager->update (b.result));
        r.insert (r.end (),
                  make_move_iterator (rs.begin ()),
                  make_move_iterator (rs.end ()));
      }
      catch (const package_error& e)
      {
        err = to_string (e.kind) + ": " + e.what ();
      }

      if (err)
      {
        for (const package& p: b.result)
          r.emplace_back (p.name, false, err);
      }
    }

    return r;
  }

  optional<pair<package_manager*, package>> multi_backend::
  find_package (const string& n, const strings& ids)
  {
    tracer trace ("multi_backend::find_package");

    for (const string& id: ids)
    {
      package_manager* pm (find_package_manager (managers_, id));

      if (pm == nullptr)
        continue;

      packages ps;
      try
      {
        ps = pm->info (strings {n});
      }
      catch (const package_error& e)
      {
        warn << id << " query for " << n << " failed: " << e.what ();
        continue;
      }

      // A community registry record without the snapshot path cannot be
      // built (normally it is a package from the official repositories).
      //
      if (id == "aur")
      {
        ps.erase (remove_if (ps.begin (), ps.end (),
                             [] (const package& p)
                             {
                               return !p.extra.url_path;
                             }),
                  ps.end ());
      }

      if (ps.empty ())
      {
        l5 ([&]{trace << n << " not found in " << id;});
        continue;
      }

      if (verb == 1)
        text << "found " << n << " in " << id;

      return make_pair (pm, move (ps.front ()));
    }

    return nullopt;
  }

  void multi_backend::
  recover (const strings& ns,
           const vector<size_t>& is,
           const packages& ps,
           vector<optional<install_result>>& rs)
  {
    tracer trace ("multi_backend::recover");

    package_manager* pm (find_package_manager (managers_, "pacman"));

    if (pm == nullptr)
      return;

    for (size_t i (0); i != is.size (); ++i)
    {
      size_t j (is[i]);
      const optional<install_result>& r (rs[j]);

      if (r && r->success)
        continue;

      const string& n (ps[i].name);

      try
      {
        packages fs (pm->info (strings {n}));

        if (fs.empty ())
        {
          l4 ([&]{trace << n << " not found in " << pm->id ();});
          continue;
        }

        package& f (fs.front ());

        if (verb == 1)
          text << "found " << n << " in " << pm->id () << ", installing";

        // Note that the primary repository version is installed even if it
        // differs from the community one.
        //
        if (f.version != ps[i].version)
          warn << "installing " << n << ' ' << f.version << " from "
               << pm->id () << " instead of " << ps[i].version << " from aur";

        install_results frs (pm->install (packages {move (f)}));

        if (!frs.empty ())
        {
          install_result& fr (frs.front ());
          rs[j] = install_result (ns[j], fr.success, move (fr.message));
        }
      }
      catch (const package_error& e)
      {
        l4 ([&]{trace << pm->id () << " fallback for " << n << " failed: "
                      << e.what ();});
      }
    }
  }

  install_results multi_backend::
  install_auto (const strings& ns)
  {
    // Matches grouped by package manager, in the first-seen order.
    //
    struct group
    {
      package_manager* manager;
      vector<size_t>   indexes;  // Into ns.
      packages         matches;
    };

    vector<group> gs;
    vector<optional<install_result>> rs (ns.size ());

    if (verb == 1)
      text << "searching across " << managers_.size ()
           << " package managers";

    strings registered (ids ());

    for (size_t i (0); i != ns.size (); ++i)
    {
      const string& n (ns[i]);

      strings cs (candidate_backends (classify_package (n), registered));
      optional<pair<package_manager*, package>> m (find_package (n, cs));

      // Try the rest of them if not found in any of the candidates.
      //
      if (!m)
      {
        strings os;
        for (const string& id: registered)
        {
          if (find (cs.begin (), cs.end (), id) == cs.end ())
            os.push_back (id);
        }

        if (!os.empty ())
          m = find_package (n, os);
      }

      if (!m)
      {
        rs[i] = install_result (n, false, string ("not found in any backend"));
        continue;
      }

      auto g (find_if (gs.begin (), gs.end (),
                       [&m] (const group& g)
                       {
                         return g.manager == m->first;
                       }));

      if (g == gs.end ())
      {
        gs.push_back (group {m->first, {}, {}});
        g = gs.end () - 1;
      }

      g->indexes.push_back (i);
      g->matches.push_back (move (m->second));
    }

    for (group& g: gs)
    {
      package_manager& pm (*g.manager);

      if (verb == 1)
      {
        diag_record dr (text);
        dr << "installing " << g.matches.size () << " package(s) via "
           << pm.name () << ':';

        for (const package& p: g.matches)
          dr << "\n  " << p.name << ' ' << p.version;
      }

      optional<string> err;
      install_results irs;

      try
      {
        irs = pm.install (g.matches);
      }
      catch (const package_error& e)
      {
        err = string ("installation via ") + pm.id () + " failed: " +
              to_string (e.kind) + ": " + e.what ();
      }

      for (size_t k (0); k != g.indexes.size (); ++k)
      {
        size_t i (g.indexes[k]);
        const string& pn (g.matches[k].name);

        if (err)
        {
          rs[i] = install_result (ns[i], false, err);
          continue;
        }

        auto r (find_if (irs.begin (), irs.end (),
                         [&pn] (const install_result& r)
                         {
                           return r.package == pn;
                         }));

        if (r != irs.end ())
          rs[i] = install_result (ns[i], r->success, move (r->message));
        else
          rs[i] = install_result (ns[i],
                                  false,
                                  string ("no result reported by ") +
                                  pm.id ());
      }

      if (strcmp (pm.id (), "aur") == 0)
        recover (ns, g.indexes, g.matches, rs);
    }

    install_results r;
    for (optional<install_result>& i: rs)
      r.push_back (move (*i));

    return r;
  }
}
