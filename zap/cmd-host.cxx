// file      : zap/cmd-host.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/cmd-host.hxx>

#include <iomanip>  // setw()
#include <iostream> // cout

#include <zap/sudo.hxx>
#include <zap/diagnostics.hxx>
#include <zap/package-manager.hxx>
#include <zap/host-os-release.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  int
  cmd_managers (const managers_options& o, cli::scanner&)
  {
    sudo_session ss (o.sudo ());
    package_managers pms (make_package_managers (o, ss, host_os_release ()));

    if (pms.empty ())
    {
      if (verb != 0)
        info << "no package managers detected on this host";

      return 1;
    }

    for (const unique_ptr<package_manager>& pm: pms)
      cout << left << setw (8) << pm->id () << right << ' ' << pm->name ()
           << endl;

    return 0;
  }

  int
  cmd_system (const system_options& o, cli::scanner&)
  {
    optional<os_release> r (host_os_release ());

    if (r)
    {
      cout << "os:      " << *r << endl
           << "id:      " << r->name_id << endl;

      if (!r->like_ids.empty ())
      {
        cout << "like:    ";
        for (size_t i (0); i != r->like_ids.size (); ++i)
          cout << (i != 0 ? " " : "") << r->like_ids[i];
        cout << endl;
      }

      if (!r->variant.empty ())
        cout << "variant: " << r->variant << endl;
    }
    else
      cout << "os:      unknown" << endl;

    sudo_session ss (o.sudo ());

    cout << "root:    " << (ss.needs_elevation () ? "no" : "yes") << endl;

    cout << "managers:";
    for (const unique_ptr<package_manager>& pm:
           make_package_managers (o, ss, r))
      cout << ' ' << pm->id ();
    cout << endl;

    return 0;
  }
}
