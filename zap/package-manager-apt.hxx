// file      : zap/package-manager-apt.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_MANAGER_APT_HXX
#define ZAP_PACKAGE_MANAGER_APT_HXX

#include <map>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package-manager.hxx>

namespace zap
{
  // The Debian/Ubuntu package manager.
  //
  class package_manager_apt: public package_manager
  {
  public:
    virtual const char*
    id () const override {return "apt";}

    virtual const char*
    name () const override {return "APT (Debian/Ubuntu)";}

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

  public:
    package_manager_apt (const common_options& co, sudo_session& s)
        : package_manager (co), sudo_ (s) {}

    // Parse the `apt-cache search` output in the `<name> - <summary>` form.
    // The versions are left empty.
    //
    static packages
    parse_search (const string&);

    // Installed (empty if none) and candidate versions.
    //
    struct policy
    {
      string installed;
      string candidate;
    };

    using policies = std::map<string, policy>;

    // Parse the `apt-cache policy <name>...` output. Unknown packages are
    // omitted.
    //
    static policies
    parse_policy (const string&);

    // Parse the first control paragraph of the `apt-cache show` output.
    //
    static optional<package>
    parse_show (const string&);

    // Parse the `apt list --upgradable` output returning the package names.
    //
    static strings
    parse_upgradable (const string&);

  private:
    policies
    apt_cache_policy (const strings&);

  private:
    sudo_session& sudo_;
  };
}

#endif // ZAP_PACKAGE_MANAGER_APT_HXX
