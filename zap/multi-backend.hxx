// file      : zap/multi-backend.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_MULTI_BACKEND_HXX
#define ZAP_MULTI_BACKEND_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package.hxx>
#include <zap/package-type.hxx>
#include <zap/package-manager.hxx>

namespace zap
{
  // Return the ids of the backends that should be queried for a package of
  // the specified type, in the priority order, restricted to the registered
  // ones. The order is:
  //
  // 1. The backends of the package's own ecosystem (npm and deno for npm,
  //    go for go, etc).
  // 2. The primary system backends (pacman, apt, dnf, zypper, pkg, brew,
  //    winget, scoop, choco).
  // 3. The universal backends (flatpak, snap).
  // 4. The community backend (aur).
  // 5. The remaining ecosystem backends (npm, deno, pip, cargo, go, pub).
  //
  // Note that pacman must come before aur so that packages available from
  // the official repositories are never built from source.
  //
  strings
  candidate_backends (package_type, const strings& registered);

  // Packages reported by a single backend.
  //
  struct backend_packages
  {
    package_manager* manager;
    packages         result;
  };

  using backend_packages_list = vector<backend_packages>;

  // The router over the registered package managers.
  //
  class multi_backend
  {
  public:
    explicit
    multi_backend (package_managers);

    const package_managers&
    managers () const {return managers_;}

    // Ids of the registered package managers in the registration order.
    //
    strings
    ids () const;

    // Query every package manager concurrently and return the non-empty
    // responses in the registration order. The package manager errors
    // (package_error) are only traced (they are not fatal for the search as
    // a whole) while failed is rethrown once all the queries are done.
    //
    backend_packages_list
    search_all (const string& query);

    backend_packages_list
    info_all (const string& name);

    backend_packages_list
    check_updates_all ();

    // Upgrade the outdated packages (normally as returned by
    // check_updates_all()) with the package manager each of them came from.
    // Return one result per package.
    //
    install_results
    update_all (const backend_packages_list&);

    // Find each package in the most appropriate package manager and install
    // the matches with one batched install per package manager. Return one
    // result per requested name in the order requested.
    //
    // If some community registry packages fail to install, then the primary
    // repository is tried for them.
    //
    // Only package_error is turned into the failed results. The failed
    // exception (for example, privileges could not be obtained) aborts the
    // whole installation.
    //
    install_results
    install_auto (const strings& names);

  private:
    template <typename F>
    backend_packages_list
    query_all (const char* what, const F&);

    // Return the package manager and the package found by the first of the
    // specified package managers that has it.
    //
    optional<pair<package_manager*, package>>
    find_package (const string& name, const strings& ids);

    // Try to install the packages that failed to install from the community
    // registry from the primary repository instead.
    //
    // The indexes refer to the requested names and results while the
    // packages are the community records, in the same order.
    //
    void
    recover (const strings& names,
             const vector<size_t>& indexes,
             const packages&,
             vector<optional<install_result>>& results);

  private:
    package_managers managers_;
  };
}

#endif // ZAP_MULTI_BACKEND_HXX
