// file      : zap/aur-build.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/aur-build.hxx>

#include <zap/fetch.hxx>
#include <zap/archive.hxx>
#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  dir_path
  aur_build_dir (const common_options& co)
  {
    if (co.build_dir_specified ())
    {
      dir_path d (co.build_dir ());
      d.complete ();
      d.normalize ();
      return d;
    }

    return cache_home () / dir_path ("zap") / dir_path ("builds");
  }

  // Scratch directory operations. Unlike mk_p(), the errors fail the package
  // being built rather than the whole command.
  //
  static void
  scratch_mkdir (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      throw package_error (package_error_kind::build,
                           "unable to create directory " + d.string () +
                           ": " + e.what ());
    }
  }

  static void
  scratch_rmdir (const dir_path& d)
  {
    if (verb >= 3)
      text << "rmdir -r " << d;

    try
    {
      try_rmdir_r (d);
    }
    catch (const system_error& e)
    {
      throw package_error (package_error_kind::build,
                           "unable to remove stale directory " + d.string () +
                           ": " + e.what ());
    }
  }

  aur_builder::
  aur_builder (const common_options& co, sudo_session& s, dir_path d)
      : options_ (co), sudo_ (s), scratch_ (move (d))
  {
  }

  dir_path aur_builder::
  fetch (const package& p)
  {
    tracer trace ("aur_builder::fetch");

    if (!p.extra.url_path || p.extra.url_path->empty ())
      throw package_error (package_error_kind::not_found,
                           p.name + " has no source snapshot URL path");

    const string& up (*p.extra.url_path);
    string url (options_.aur_url () + up);

    dir_path d (scratch_ / dir_path (p.name));

    if (verb == 1)
      text << "downloading " << p.name;

    scratch_mkdir (scratch_);
    scratch_rmdir (d);

    if (simulate_ != nullptr)
    {
      simulate_->downloads.push_back (url);

      auto i (simulate_->snapshots.find (p.name));
      if (i == simulate_->snapshots.end ())
        throw package_error (package_error_kind::network,
                             "unable to fetch " + url + ": exit code 22");

      scratch_mkdir (d);

      path f (d / path ("PKGBUILD"));
      try
      {
        ofdstream os (f);
        os << i->second;
        os.close ();
      }
      catch (const io_error& e)
      {
        throw package_error (package_error_kind::build,
                             "unable to write to " + f.string () + ": " +
                             e.what ());
      }

      return d;
    }

    // The snapshot is normally <name>.tar.gz with the <name>/ top-level
    // directory.
    //
    path a;
    try
    {
      a = scratch_ / path (up).leaf ();
    }
    catch (const invalid_path&)
    {
      throw package_error (package_error_kind::not_found,
                           "invalid source snapshot URL path '" + up + "'");
    }

    auto_rmfile arm (a);

    fetch_file (options_, url, a);

    if (verb == 1)
      text << "extracting " << a.leaf ();

    extract (options_, a, scratch_);

    if (!exists (d, true /* ignore_error */))
      throw package_error (package_error_kind::build,
                           "snapshot " + a.leaf ().string () +
                           " does not contain " + p.name + " directory");

    l4 ([&]{trace << "extracted " << a << " into " << d;});

    return d;
  }

  bool aur_builder::
  makepkg (const dir_path& d, const package& p, bool install)
  {
    const char* args[] = {
      "makepkg",
      install ? "-si" : "-s",
      "--needed",
      "--noconfirm",
      "--skipinteg",
      nullptr};

    if (verb >= 2)
      print_process (args);
    else if (verb == 1)
      text << (install ? "building and installing " : "building ") << p.name;

    if (simulate_ != nullptr)
    {
      strings c {p.name};
      for (const char* const* a (args); *a != nullptr; ++a)
        c.push_back (*a);

      simulate_->commands.push_back (move (c));

      const set<string>& fs (install
                             ? simulate_->install_failures
                             : simulate_->build_failures);

      if (fs.find (p.name) != fs.end ())
        return false;

      if (!install)
      {
        auto i (simulate_->artifacts.find (p.name));
        if (i != simulate_->artifacts.end ())
        {
          ofdstream os (d / path (i->second));
          os.close ();
        }
      }

      return true;
    }

    try
    {
      process_path pp (process::path_search (args[0]));
      process pr (pp, args, 0, 1, 2, d.string ().c_str ());
      return pr.wait ();
    }
    catch (const process_error& e)
    {
      if (e.child)
      {
        error << "unable to execute " << args[0] << ": " << e;
        exit (1);
      }

      throw package_error (package_error_kind::build,
                           string ("unable to execute ") + args[0] + ": " +
                           e.what ());
    }
  }

  void aur_builder::
  build (const package& p)
  {
    dir_path d (fetch (p));

    if (makepkg (d, p, true /* install */))
      return;

    // The dependencies that makepkg failed to install are expected to be
    // taken care of by the dependency resolution.
    //
    if (verb >= 1)
      info << "retrying " << p.name << " build without installing";

    if (!makepkg (d, p, false /* install */))
      throw package_error (package_error_kind::build,
                           "makepkg failed for " + p.name);

    optional<path> a (find_artifact (d));

    if (!a)
      throw package_error (package_error_kind::build,
                           "unable to find built package file for " + p.name);

    if (!sudo_.run ({"pacman", "-U", "--noconfirm", "--needed",
                     a->string ().c_str (), nullptr}))
      throw package_error (package_error_kind::build,
                           "unable to install " + a->leaf ().string ());
  }

  optional<path> aur_builder::
  find_artifact (const dir_path& d)
  {
    static const char* const exts[] = {
      ".pkg.tar.zst", ".pkg.tar.xz", ".pkg.tar.gz", ".pkg.tar.bz2", ".pkg.tar",
      nullptr};

    auto artifact = [] (const string& n)
    {
      for (const char* const* e (exts); *e != nullptr; ++e)
      {
        size_t m (strlen (*e));

        if (n.size () > m && n.compare (n.size () - m, m, *e) == 0)
          return true;
      }

      return false;
    };

    strings ns;
    try
    {
      for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
      {
        if (de.type () != entry_type::regular)
          continue;

        string n (de.path ().string ());

        if (artifact (n))
          ns.push_back (move (n));
      }
    }
    catch (const system_error& e)
    {
      throw package_error (package_error_kind::build,
                           "unable to scan directory " + d.string () + ": " +
                           e.what ());
    }

    if (ns.empty ())
      return nullopt;

    sort (ns.begin (), ns.end ());

    auto i (find_if (ns.begin (), ns.end (),
                     [] (const string& n)
                     {
                       return n.find ("-debug-") == string::npos;
                     }));

    return d / path (i != ns.end () ? *i : ns.front ());
  }
}
