// file      : zap/package-manager-go.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_MANAGER_GO_HXX
#define ZAP_PACKAGE_MANAGER_GO_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package-manager.hxx>

namespace zap
{
  // Go commands installed with `go install <module-path>@<version>`.
  //
  // There is no search API so searching is the exact module path lookup on
  // the module proxy. There is also no record of the installed versions so
  // updates cannot be detected (but can be requested explicitly).
  //
  class package_manager_go: public package_manager
  {
  public:
    virtual const char*
    id () const override {return "go";}

    virtual const char*
    name () const override {return "Go (go install)";}

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
    package_manager_go (const common_options& co,
                        string proxy = "https://proxy.golang.org")
        : package_manager (co), proxy_ (move (proxy)) {}

    // Parse the module proxy @latest response returning the Version value,
    // if any. Throw package_error (parse) on invalid input.
    //
    static optional<string>
    parse_latest (const string&);

    // Escape the module path for the proxy protocol: each upper-case letter
    // is replaced with an exclamation mark followed by its lower-case
    // version.
    //
    static string
    escape_module_path (const string&);

    // Return the name of the binary that `go install` produces for the
    // package path (the last path component, ignoring the major version
    // suffix and the @version part).
    //
    static string
    binary_name (const string&);

    // The directories go install places binaries into, in the lookup order:
    // $GOBIN, $GOPATH/bin, and ~/go/bin.
    //
    static dir_paths
    bin_dirs ();

  private:
    install_results
    run_install (const packages&, bool latest);

  private:
    string proxy_;
  };
}

#endif // ZAP_PACKAGE_MANAGER_GO_HXX
