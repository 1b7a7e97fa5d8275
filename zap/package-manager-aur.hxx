// file      : zap/package-manager-aur.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_MANAGER_AUR_HXX
#define ZAP_PACKAGE_MANAGER_AUR_HXX

#include <map>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/aur-build.hxx>
#include <zap/aur-resolve.hxx>
#include <zap/package-manager.hxx>

namespace zap
{
  // The Arch User Repository.
  //
  // The package metadata is queried with the RPC interface (v5) while the
  // packages themselves are built from the source snapshots. Installation
  // status is queried with pacman.
  //
  class package_manager_aur: public package_manager,
                             public aur_dependency_source
  {
  public:
    virtual const char*
    id () const override {return "aur";}

    virtual const char*
    name () const override {return "AUR (Arch User Repository)";}

    // Search by name falling back to search by name and description. The
    // result is sorted by popularity (most popular first).
    //
    virtual packages
    search (const string&) override;

    virtual packages
    info (const strings&) override;

    // For each package resolve its community dependencies, build and
    // install them (deepest first), and then build and install the package
    // itself. The dependency failures are diagnosed but do not prevent the
    // attempt to install the package.
    //
    virtual install_results
    install (const packages&) override;

    virtual bool
    is_installed (const string&) override;

    // List the foreign (not from the official repositories) packages.
    //
    virtual installed_packages
    list_installed () override;

    virtual packages
    check_updates () override;

    // aur_dependency_source
    //
    virtual strings
    descriptor_depends (const package&) override;

    virtual bool
    installed (const string&) override;

    virtual bool
    in_primary_repository (const string&) override;

    virtual optional<package>
    community_package (const string&) override;

  public:
    package_manager_aur (const common_options&, sudo_session&);

    package_manager_aur (const common_options&, sudo_session&, dir_path);

    aur_builder&
    builder () {return builder_;}

    // Parse the RPC response:
    //
    // {"resultcount": 1, "type": "multiinfo", "version": 5,
    //  "results": [{"ID": ..., "Name": "...", ...}]}
    //
    // Or, in case of an error:
    //
    // {"error": "Too many package results.", "resultcount": 0,
    //  "results": [], "type": "error", "version": 5}
    //
    // Throw package_error (parse) on invalid input.
    //
    struct rpc_response
    {
      packages         results;
      optional<string> error;
    };

    static rpc_response
    parse_rpc (const string&);

    // Return true if the `pacman -Ss ^<name>$` output lists the package in
    // one of the official repositories.
    //
    static bool
    parse_primary (const string& output, const string& name);

    // Testing hook. If not NULL, then the RPC responses are looked up by
    // the request URL instead of being fetched (a missing entry is a
    // network error).
    //
    std::map<string, string>* simulate_rpc_ = nullptr;

  private:
    rpc_response
    rpc (const string& url);

    install_result
    install_one (const package&);

  private:
    aur_builder builder_;
    string      rpc_url_;
  };
}

#endif // ZAP_PACKAGE_MANAGER_AUR_HXX
