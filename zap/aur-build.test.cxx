// file      : zap/aur-build.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/aur-build.hxx>

#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;

namespace zap
{
  static package
  aur_package (const string& n)
  {
    package p (n, "1.0-1");
    p.extra.url_path = "/cgit/aur.git/snapshot/" + n + ".tar.gz";
    return p;
  }

  static void
  touch (const path& f)
  {
    ofdstream os (f);
    os.close ();
  }

  static package_error_kind
  build_error (aur_builder& b, const package& p)
  {
    try
    {
      b.build (p);
    }
    catch (const package_error& e)
    {
      return e.kind;
    }

    assert (false);
    return package_error_kind::parse;
  }

  int
  main ()
  {
    verb = 0;

    auto_rmdir rm (dir_path::temp_path ("zap-aur-build"));
    const dir_path& scratch (rm.path);

    common_options co;

    sudo_session::simulation ss;
    ss.elevated = true;

    sudo_session sudo;
    sudo.simulate_ = &ss;

    // Fetch writes the descriptor into <scratch>/<name>/ replacing the
    // stale directory.
    //
    {
      aur_builder::simulation s;
      s.snapshots["yay"] = "pkgname=yay\ndepends=(git)\n";

      aur_builder b (co, sudo, scratch);
      b.simulate_ = &s;

      mk_p (scratch / dir_path ("yay"));
      touch (scratch / dir_path ("yay") / path ("stale"));

      dir_path d (b.fetch (aur_package ("yay")));

      assert (d == scratch / dir_path ("yay"));
      assert (exists (d / path ("PKGBUILD")));
      assert (!exists (d / path ("stale")));

      assert (s.downloads.size () == 1);
      assert (s.downloads[0] ==
              "https://aur.archlinux.org/cgit/aur.git/snapshot/yay.tar.gz");
    }

    // Missing snapshot path and download failure.
    //
    {
      aur_builder::simulation s;

      aur_builder b (co, sudo, scratch);
      b.simulate_ = &s;

      assert (build_error (b, package ("nourl", "1")) ==
              package_error_kind::not_found);

      assert (build_error (b, aur_package ("gone")) ==
              package_error_kind::network);

      assert (s.commands.empty ());
    }

    // A package directory that cannot be set up fails this package only.
    //
    {
      aur_builder::simulation s;
      s.snapshots["blocked"] = "pkgname=blocked\n";
      s.snapshots["free"] = "pkgname=free\n";

      aur_builder b (co, sudo, scratch);
      b.simulate_ = &s;

      touch (scratch / path ("blocked")); // Not a directory.

      assert (build_error (b, aur_package ("blocked")) ==
              package_error_kind::build);
      assert (s.commands.empty ());

      b.build (aur_package ("free"));
      assert (s.commands.size () == 1);
    }

    // Build and install in one go.
    //
    {
      aur_builder::simulation s;
      s.snapshots["foo"] = "pkgname=foo\n";

      ss.commands.clear ();

      aur_builder b (co, sudo, scratch);
      b.simulate_ = &s;
      b.build (aur_package ("foo"));

      assert (s.commands.size () == 1);
      assert ((s.commands[0] ==
               strings {"foo", "makepkg", "-si", "--needed", "--noconfirm",
                        "--skipinteg"}));

      assert (ss.commands.empty ());
    }

    // If installing fails, then build without installing and install the
    // resulting package with pacman.
    //
    {
      aur_builder::simulation s;
      s.snapshots["bar"] = "pkgname=bar\n";
      s.install_failures = {"bar"};
      s.artifacts["bar"] = "bar-1.0-1-x86_64.pkg.tar.zst";

      ss.commands.clear ();

      aur_builder b (co, sudo, scratch);
      b.simulate_ = &s;
      b.build (aur_package ("bar"));

      assert (s.commands.size () == 2);
      assert (s.commands[1][2] == "-s");

      path a (scratch / dir_path ("bar") /
              path ("bar-1.0-1-x86_64.pkg.tar.zst"));

      assert (ss.commands.size () == 1);
      assert ((ss.commands[0] ==
               strings {"pacman", "-U", "--noconfirm", "--needed",
                        a.string ()}));
    }

    // The fallback build fails or produces nothing.
    //
    {
      aur_builder::simulation s;
      s.snapshots["baz"] = "pkgname=baz\n";
      s.snapshots["qux"] = "pkgname=qux\n";
      s.install_failures = {"baz", "qux"};
      s.build_failures = {"baz"};

      aur_builder b (co, sudo, scratch);
      b.simulate_ = &s;

      assert (build_error (b, aur_package ("baz")) ==
              package_error_kind::build);

      assert (build_error (b, aur_package ("qux")) ==
              package_error_kind::build);
    }

    // The privileged install of the built package fails.
    //
    {
      aur_builder::simulation s;
      s.snapshots["quux"] = "pkgname=quux\n";
      s.install_failures = {"quux"};
      s.artifacts["quux"] = "quux-2-1-any.pkg.tar.xz";

      sudo_session::simulation fs;
      fs.elevated = true;
      fs.execute = [] (const strings&) {return false;};

      sudo_session fsudo;
      fsudo.simulate_ = &fs;

      aur_builder b (co, fsudo, scratch);
      b.simulate_ = &s;

      assert (build_error (b, aur_package ("quux")) ==
              package_error_kind::build);
    }

    // Prefer the main package to the debug one.
    //
    {
      dir_path d (scratch / dir_path ("artifacts"));
      mk_p (d);

      assert (!aur_builder::find_artifact (d));

      touch (d / path ("PKGBUILD"));
      touch (d / path ("foo-debug-1.0-1-x86_64.pkg.tar.zst"));

      assert (*aur_builder::find_artifact (d) ==
              d / path ("foo-debug-1.0-1-x86_64.pkg.tar.zst"));

      touch (d / path ("foo-1.0-1-x86_64.pkg.tar.zst"));
      touch (d / path ("foo-1.0-1-x86_64.pkg.tar.zst.sig"));

      assert (*aur_builder::find_artifact (d) ==
              d / path ("foo-1.0-1-x86_64.pkg.tar.zst"));
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
