// file      : zap/cmd-install.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/cmd-install.hxx>

#include <iomanip>  // setw()
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
  print_install_summary (ostream& os, const install_results& rs)
  {
    size_t w (7); // package
    for (const install_result& r: rs)
      w = max (w, r.package.size ());

    os << left
       << setw (w) << "package" << "  " << setw (9) << "status" << "  "
       << "message" << endl;

    for (const install_result& r: rs)
    {
      os << setw (w) << r.package << "  ";

      if (r.message)
        os << setw (9) << (r.success ? "installed" : "failed") << "  "
           << *r.message;
      else
        os << (r.success ? "installed" : "failed");

      os << endl;
    }

    os << right;
  }

  // Print the summary and return the exit code.
  //
  static int
  summarize (const install_results& rs)
  {
    print_install_summary (cout, rs);

    size_t f (count_if (rs.begin (), rs.end (),
                        [] (const install_result& r) {return !r.success;}));

    if (f != 0)
    {
      error << f << " of " << rs.size () << " package(s) failed to install";
      return 1;
    }

    return 0;
  }

  int
  cmd_install (const install_options& o, cli::scanner& args)
  {
    if (!args.more ())
      fail << "package name argument expected" <<
        info << "run 'zap help install' for more information";

    strings ns;
    while (args.more ())
    {
      string n (args.next ());

      if (n.empty ())
        fail << "empty package name";

      // Skip duplicates.
      //
      if (find (ns.begin (), ns.end (), n) == ns.end ())
        ns.push_back (move (n));
    }

    sudo_session ss (o.sudo ());
    multi_backend mb (make_package_managers (o, ss, host_os_release ()));

    return summarize (mb.install_auto (ns));
  }

  int
  cmd_update (const update_options& o, cli::scanner&)
  {
    sudo_session ss (o.sudo ());
    multi_backend mb (make_package_managers (o, ss, host_os_release ()));

    if (verb == 1)
      text << "checking for updates";

    backend_packages_list bs (mb.check_updates_all ());

    if (bs.empty ())
    {
      if (verb != 0)
        info << "all packages are up to date";

      return 0;
    }

    size_t n (0);
    for (const backend_packages& b: bs)
    {
      cout << b.manager->name () << ':' << endl;

      for (const package& p: b.result)
      {
        cout << "  " << p.name << ' ' << p.version << endl;
        ++n;
      }
    }

    if (o.check ())
      return 0;

    if (!o.yes () &&
        !yn_prompt ("update " + to_string (n) + " package(s)? [Y/n]", 'y'))
      return 1;

    return summarize (mb.update_all (bs));
  }
}
