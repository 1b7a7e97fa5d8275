// file      : zap/package-manager.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_MANAGER_HXX
#define ZAP_PACKAGE_MANAGER_HXX

#include <map>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/sudo.hxx>
#include <zap/package.hxx>
#include <zap/host-os-release.hxx>

#include <zap/zap-options.hxx>

namespace zap
{
  // Installed package name and version.
  //
  using installed_packages = vector<pair<string, string>>;

  // The package manager capability: the uniform set of operations that
  // every backend (system package manager, community registry, language
  // ecosystem tool) implements on top of its native tooling.
  //
  // Querying functions return an empty result if nothing is found and throw
  // package_error if the backend query itself failed (the native tool could
  // not be executed, its output could not be parsed, the registry is not
  // reachable, etc). The install functions return one result per package,
  // in the order requested.
  //
  class package_manager
  {
  public:
    // Short lowercase identifier (pacman, apt, aur, npm, etc).
    //
    virtual const char*
    id () const = 0;

    // Human-readable name.
    //
    virtual const char*
    name () const = 0;

    virtual packages
    search (const string& query) = 0;

    // Return the packages found, potentially fewer than requested.
    //
    virtual packages
    info (const strings& names) = 0;

    virtual install_results
    install (const packages&) = 0;

    virtual bool
    is_installed (const string& name) = 0;

    virtual installed_packages
    list_installed () = 0;

    // Return the installed packages with newer versions available (the
    // versions in the returned packages are the new ones).
    //
    virtual packages
    check_updates () = 0;

    virtual install_results
    update (const packages& ps) {return install (ps);}

    virtual
    ~package_manager ();

    // Testing hook. If not NULL, then instead of executing the commands
    // record them and return the predefined outcome. Specifically, a
    // captured command returns the output mapped to its command line (the
    // command is assumed to fail if there is no mapping) and an executed
    // command fails only if its command line is in the failures set.
    //
    struct simulation
    {
      std::map<strings, string> output;
      vector<strings>           failures;

      vector<strings>           commands;
    };

    simulation* simulate_ = nullptr;

  protected:
    explicit
    package_manager (const common_options& co): options_ (co) {}

    // Run the command redirecting stdin to /dev/null and return its stdout
    // or nullopt if it exited with non-zero status (unless ignore_status is
    // true, in which case the output is returned regardless). Throw
    // package_error if the output cannot be read and issue diagnostics and
    // throw failed if the program cannot be executed.
    //
    optional<string>
    capture (const cstrings& args, bool ignore_status = false);

    // Run the command with inherited standard streams and return true if it
    // exited with zero status.
    //
    bool
    execute (const cstrings& args, const dir_path& cwd = dir_path ());

    // Return the simulated command outcome, if simulating.
    //
    optional<string>
    simulate_capture (const cstrings& args);

    bool
    simulate_execute (const cstrings& args);

  protected:
    const common_options& options_;
  };

  using package_managers = vector<unique_ptr<package_manager>>;

  // Create the package managers available on this host in the registration
  // order: the system package managers (the host's native one first), the
  // community registry, and the language ecosystems.
  //
  // If --backend is specified, then only create the listed package managers
  // and fail if any of them is unknown or not available on this host.
  //
  package_managers
  make_package_managers (const common_options&,
                         sudo_session&,
                         const optional<os_release>&);

  // Return the package manager with the specified id or NULL if none is
  // registered.
  //
  package_manager*
  find_package_manager (const package_managers&, const string& id);
}

#endif // ZAP_PACKAGE_MANAGER_HXX
