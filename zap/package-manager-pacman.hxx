// file      : zap/package-manager-pacman.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_MANAGER_PACMAN_HXX
#define ZAP_PACKAGE_MANAGER_PACMAN_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package-manager.hxx>

namespace zap
{
  // The Arch Linux official repositories package manager.
  //
  class package_manager_pacman: public package_manager
  {
  public:
    virtual const char*
    id () const override {return "pacman";}

    virtual const char*
    name () const override {return "pacman (Arch Linux)";}

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
    package_manager_pacman (const common_options& co, sudo_session& s)
        : package_manager (co), sudo_ (s) {}

    // Parse the `pacman -Ss` output in the following form:
    //
    // extra/vim 9.1.0-1 [installed]
    //     Vi Improved, a highly configurable, improved version of the vi...
    // extra/vim-airline 0.11-6
    //     Lean & mean status/tabline for vim that's light as air
    //
    static packages
    parse_search (const string&);

    // Parse the `pacman -Si <name>` output which is a sequence of the
    // `Key : Value` lines. Return nullopt if there is no Name line.
    //
    static optional<package>
    parse_info (const string&);

    // Parse the `pacman -Qu` output in the `<name> <old> -> <new>` form
    // returning the package names.
    //
    static strings
    parse_upgrades (const string&);

    // Parse the `<name> <version>` lines (`pacman -Q` and alike output).
    //
    static installed_packages
    parse_installed (const string&);

  private:
    sudo_session& sudo_;
  };
}

#endif // ZAP_PACKAGE_MANAGER_PACMAN_HXX
