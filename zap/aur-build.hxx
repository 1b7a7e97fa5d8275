// file      : zap/aur-build.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_AUR_BUILD_HXX
#define ZAP_AUR_BUILD_HXX

#include <map>
#include <set>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/sudo.hxx>
#include <zap/package.hxx>

#include <zap/zap-options.hxx>

namespace zap
{
  // Download, build, and install the community registry packages.
  //
  // The source snapshots are extracted into the scratch directory, one
  // subdirectory per package, and built there with makepkg.
  //
  class aur_builder
  {
  public:
    aur_builder (const common_options&, sudo_session&, dir_path scratch);

    const dir_path&
    scratch () const {return scratch_;}

    // Download the package source snapshot and extract it into
    // <scratch>/<name>/ replacing the stale directory, if any. Return the
    // package directory.
    //
    // Throw package_error (not_found) if the package has no snapshot URL
    // path, (network) if the download fails, and (build) if the snapshot
    // cannot be extracted.
    //
    dir_path
    fetch (const package&);

    // Fetch, build, and install the package. First try to build and install
    // in one go letting makepkg install the missing dependencies from the
    // primary repository. If that fails, then retry building without
    // installing and install the resulting binary package with pacman.
    //
    // Throw package_error if any of these steps fails. Note that this
    // doesn't install the community dependencies (see
    // resolve_aur_dependencies()).
    //
    void
    build (const package&);

    // Return the binary package built in the specified directory, if any.
    // Prefer the main package to the debug one if both are present.
    //
    static optional<path>
    find_artifact (const dir_path&);

    // Testing hook. If not NULL, then instead of fetching and running
    // makepkg, use the predefined outcomes.
    //
    struct simulation
    {
      // PKGBUILD contents for the packages that can be downloaded.
      //
      std::map<string, string> snapshots;

      // Packages for which makepkg fails with and without installing.
      //
      std::set<string> install_failures;
      std::set<string> build_failures;

      // Binary package files produced by makepkg without installing.
      //
      std::map<string, string> artifacts;

      // Downloaded URLs and makepkg command lines (prefixed with the package
      // name).
      //
      strings         downloads;
      vector<strings> commands;
    };

    simulation* simulate_ = nullptr;

  private:
    bool
    makepkg (const dir_path&, const package&, bool install);

  private:
    const common_options& options_;
    sudo_session& sudo_;
    dir_path scratch_;
  };

  // Return the --build-dir value or, if unspecified, the default scratch
  // directory ($XDG_CACHE_HOME/zap/builds/).
  //
  dir_path
  aur_build_dir (const common_options&);
}

#endif // ZAP_AUR_BUILD_HXX
