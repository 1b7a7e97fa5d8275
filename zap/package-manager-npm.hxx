// file      : zap/package-manager-npm.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_MANAGER_NPM_HXX
#define ZAP_PACKAGE_MANAGER_NPM_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package-manager.hxx>

namespace zap
{
  // The Node.js package manager. Packages are installed globally.
  //
  class package_manager_npm: public package_manager
  {
  public:
    virtual const char*
    id () const override {return "npm";}

    virtual const char*
    name () const override {return "npm (Node.js)";}

    virtual packages
    search (const string&) override;

    virtual packages
    info (const strings&) override;

    virtual install_results
    install (const packages&) override;

    virtual bool
    is_installed (const string&) override;

    virtual installed_packages
    list_installed () override;

    virtual packages
    check_updates () override;

    virtual install_results
    update (const packages&) override;

  public:
    explicit
    package_manager_npm (const common_options& co,
                         string registry = "https://registry.npmjs.org")
        : package_manager (co), registry_ (move (registry)) {}

    // Parse the registry search response:
    //
    // {"objects": [{"package": {...}, "score": {"detail": {...}}}, ...]}
    //
    // The popularity score (0 to 1) is scaled to 0 to 100.
    //
    // All the parse functions throw package_error (parse) on invalid input.
    //
    static packages
    parse_search (const string&);

    // Parse the latest version manifest (/<name>/latest).
    //
    static optional<package>
    parse_manifest (const string&);

    // Parse the `npm list -g --depth 0 --json` output.
    //
    static installed_packages
    parse_list (const string&);

    // Parse the `npm outdated -g --json` output returning packages with the
    // latest versions.
    //
    static packages
    parse_outdated (const string&);

  private:
    install_results
    run_install (const char* command, const packages&);

  private:
    string registry_;
  };
}

#endif // ZAP_PACKAGE_MANAGER_NPM_HXX
