// file      : zap/package-manager.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager.hxx>

#include <zap/diagnostics.hxx>

#include <zap/package-manager-go.hxx>
#include <zap/package-manager-apt.hxx>
#include <zap/package-manager-aur.hxx>
#include <zap/package-manager-npm.hxx>
#include <zap/package-manager-pacman.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  package_manager::
  ~package_manager ()
  {
    // vtable
  }

  static strings
  command_line (const cstrings& args)
  {
    strings r;
    for (const char* a: args)
    {
      if (a == nullptr)
        break;

      r.push_back (a);
    }
    return r;
  }

  optional<string> package_manager::
  simulate_capture (const cstrings& args)
  {
    strings c (command_line (args));
    simulate_->commands.push_back (c);

    auto i (simulate_->output.find (c));
    if (i != simulate_->output.end ())
      return i->second;

    return nullopt;
  }

  bool package_manager::
  simulate_execute (const cstrings& args)
  {
    strings c (command_line (args));
    simulate_->commands.push_back (c);

    const vector<strings>& fs (simulate_->failures);
    return find (fs.begin (), fs.end (), c) == fs.end ();
  }

  optional<string> package_manager::
  capture (const cstrings& args, bool ignore_status)
  {
    assert (!args.empty () && args.back () == nullptr);

    if (verb >= 3)
      print_process (args);

    if (simulate_ != nullptr)
      return simulate_capture (args);

    try
    {
      process_path pp (process::path_search (args[0], false /* init */));

      // Redirect stdin to /dev/null to make sure there are no prompts of any
      // kind. Native tools report conditions like an unknown package on
      // stderr which for us are normal outcomes, so only show them at the
      // higher verbosity levels.
      //
      process pr (pp, args.data (), -2, -1, verb >= 4 ? 2 : -2);

      string r;
      try
      {
        ifdstream is (move (pr.in_ofd),
                      fdstream_mode::skip,
                      ifdstream::badbit);
        r = is.read_text ();
        is.close ();
      }
      catch (const io_error& e)
      {
        if (pr.wait ())
          throw package_error (package_error_kind::parse,
                               string ("unable to read ") + args[0] +
                               " output: " + e.what ());

        // Fall through.
      }

      if (pr.wait () || ignore_status)
        return r;

      return nullopt;
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  bool package_manager::
  execute (const cstrings& args, const dir_path& cwd)
  {
    assert (!args.empty () && args.back () == nullptr);

    if (verb >= 2)
      print_process (args);

    if (simulate_ != nullptr)
      return simulate_execute (args);

    try
    {
      process_path pp (process::path_search (args[0], false /* init */));
      process pr (pp,
                  args.data (),
                  0, 1, 2,
                  cwd.empty () ? nullptr : cwd.string ().c_str ());

      return pr.wait ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  // Return true if the native tooling of the specified package manager is
  // available on this host.
  //
  static bool
  available (const string& id)
  {
    if (id == "pacman") return find_program ("pacman");
    if (id == "apt")    return find_program ("apt-get") &&
                               find_program ("apt-cache");
    if (id == "aur")    return find_program ("pacman") &&
                               find_program ("makepkg");
    if (id == "npm")    return find_program ("npm");
    if (id == "go")     return find_program ("go");

    return false;
  }

  package_managers
  make_package_managers (const common_options& co,
                         sudo_session& sudo,
                         const optional<os_release>& os)
  {
    tracer trace ("make_package_managers");

    // Registration order. The host's native system package manager goes
    // first.
    //
    strings ids;
    if (os && (os->is_or_like ("debian") || os->is_or_like ("ubuntu")))
      ids = {"apt", "pacman"};
    else
      ids = {"pacman", "apt"};

    ids.insert (ids.end (), {"aur", "npm", "go"});

    // Verify the requested package managers, if any.
    //
    const strings& rs (co.backend ());

    for (const string& r: rs)
    {
      if (find (ids.begin (), ids.end (), r) == ids.end ())
        fail << "unknown package manager '" << r << "'" <<
          info << "known package managers: pacman, apt, aur, npm, go";

      if (!available (r))
        fail << "package manager '" << r << "' is not available on this host";
    }

    package_managers r;

    for (const string& id: ids)
    {
      if (!rs.empty ())
      {
        if (find (rs.begin (), rs.end (), id) == rs.end ())
          continue;
      }
      else if (!available (id))
      {
        l4 ([&]{trace << id << " is not available";});
        continue;
      }

      l4 ([&]{trace << "registering " << id;});

      package_manager* pm (nullptr);

      if      (id == "pacman") pm = new package_manager_pacman (co, sudo);
      else if (id == "apt")    pm = new package_manager_apt (co, sudo);
      else if (id == "aur")    pm = new package_manager_aur (co, sudo);
      else if (id == "npm")    pm = new package_manager_npm (co);
      else if (id == "go")     pm = new package_manager_go (co);

      r.emplace_back (pm);
    }

    return r;
  }

  package_manager*
  find_package_manager (const package_managers& pms, const string& id)
  {
    for (const unique_ptr<package_manager>& pm: pms)
    {
      if (id == pm->id ())
        return pm.get ();
    }

    return nullptr;
  }
}
