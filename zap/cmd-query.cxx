// file      : zap/cmd-query.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/cmd-query.hxx>

#include <iostream> // cout

#include <zap/sudo.hxx>
#include <zap/diagnostics.hxx>
#include <zap/multi-backend.hxx>
#include <zap/host-os-release.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  void
  print_package_details (ostream& os, const package& p, const char* ind)
  {
    auto field = [&os, ind] (const char* n) -> ostream&
    {
      return os << ind << n << ": ";
    };

    field ("version") << p.version << endl;

    if (p.description)
      field ("description") << *p.description << endl;

    if (p.extra.repository)
      field ("repository") << *p.extra.repository << endl;

    if (p.maintainer)
      field ("maintainer") << *p.maintainer << endl;

    if (p.url)
      field ("url") << *p.url << endl;

    if (!p.extra.license.empty ())
    {
      ostream& o (field ("license"));
      for (size_t i (0); i != p.extra.license.size (); ++i)
        o << (i != 0 ? ", " : "") << p.extra.license[i];
      o << endl;
    }

    if (!p.extra.depends.empty ())
    {
      ostream& o (field ("depends"));
      for (size_t i (0); i != p.extra.depends.size (); ++i)
        o << (i != 0 ? " " : "") << p.extra.depends[i];
      o << endl;
    }

    if (p.extra.aur_votes)
      field ("votes") << *p.extra.aur_votes << endl;

    if (p.popularity != 0)
      field ("popularity") << p.popularity << endl;

    if (p.extra.out_of_date)
      field ("out-of-date") << "yes" << endl;

    field ("installed") << (p.installed ? "yes" : "no") << endl;
  }

  int
  cmd_search (const search_options& o, cli::scanner& args)
  {
    tracer trace ("search");

    if (!args.more ())
      fail << "search query argument expected" <<
        info << "run 'zap help search' for more information";

    // Treat multiple arguments as a single query with spaces.
    //
    string q (args.next ());
    while (args.more ())
    {
      q += ' ';
      q += args.next ();
    }

    l4 ([&]{trace << "query: '" << q << "'";});

    sudo_session ss (o.sudo ());
    multi_backend mb (make_package_managers (o, ss, host_os_release ()));

    size_t n (0);
    for (const backend_packages& b: mb.search_all (q))
    {
      bool first (true);

      for (const package& p: b.result)
      {
        if (o.installed () && !p.installed)
          continue;

        if (first)
        {
          cout << b.manager->name () << ':' << endl;
          first = false;
        }

        cout << "  " << p.name << ' ' << p.version;

        if (p.installed)
          cout << " [installed]";

        if (p.extra.out_of_date)
          cout << " [out of date]";

        cout << endl;

        if (p.description)
          cout << "      " << *p.description << endl;

        ++n;
      }
    }

    if (n == 0 && verb != 0)
      info << "no packages found matching '" << q << "'";

    return 0;
  }

  int
  cmd_info (const info_options& o, cli::scanner& args)
  {
    if (!args.more ())
      fail << "package name argument expected" <<
        info << "run 'zap help info' for more information";

    sudo_session ss (o.sudo ());
    multi_backend mb (make_package_managers (o, ss, host_os_release ()));

    int r (0);
    bool first (true);

    while (args.more ())
    {
      string n (args.next ());
      backend_packages_list bs (mb.info_all (n));

      if (bs.empty ())
      {
        error << "package " << n << " not found in any backend";
        r = 1;
        continue;
      }

      for (const backend_packages& b: bs)
      {
        for (const package& p: b.result)
        {
          if (!first)
            cout << endl;

          first = false;

          cout << p.name << " (" << b.manager->id () << ')' << endl;
          print_package_details (cout, p, "  ");
        }
      }
    }

    return r;
  }

  int
  cmd_list (const list_options& o, cli::scanner&)
  {
    sudo_session ss (o.sudo ());
    multi_backend mb (make_package_managers (o, ss, host_os_release ()));

    int r (0);

    for (const unique_ptr<package_manager>& pm: mb.managers ())
    {
      try
      {
        installed_packages ps (pm->list_installed ());

        cout << pm->name () << ": " << ps.size () << " package(s)" << endl;

        for (const pair<string, string>& p: ps)
          cout << "  " << p.first << ' ' << p.second << endl;
      }
      catch (const package_error& e)
      {
        error << "unable to list " << pm->id () << " packages: " << e.what ();
        r = 1;
      }
    }

    return r;
  }
}
