// file      : zap/host-os-release.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/host-os-release.hxx>

#include <sstream>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;

namespace zap
{
  static os_release
  parse (const string& content)
  {
    auto_rmfile f (path::temp_path ("zap-os-release"));

    ofdstream os (f.path);
    os << content;
    os.close ();

    return host_os_release_linux (f.path);
  }

  int
  main ()
  {
    // Ubuntu, quoted values and ID_LIKE list.
    //
    {
      os_release r (parse ("PRETTY_NAME=\"Ubuntu 22.04.3 LTS\"\n"
                           "NAME=\"Ubuntu\"\n"
                           "VERSION_ID=\"22.04\"\n"
                           "VERSION_CODENAME=jammy\n"
                           "ID=ubuntu\n"
                           "ID_LIKE=debian\n"));

      assert (r.name_id == "ubuntu");
      assert (r.like_ids == strings ({"debian"}));
      assert (r.version_id == "22.04");
      assert (r.variant_id.empty ());
      assert (r.name == "Ubuntu");
      assert (r.version_codename == "jammy");

      assert (r.is_or_like ("debian"));
      assert (r.is_or_like ("ubuntu"));
      assert (!r.is_or_like ("arch"));

      ostringstream o;
      o << r;
      assert (o.str () == "Ubuntu 22.04 (jammy)");
    }

    // Arch derivative, comments and blank lines, multi-word ID_LIKE.
    //
    {
      os_release r (parse ("# Generated file.\n"
                           "\n"
                           "NAME='EndeavourOS'\n"
                           "ID=endeavouros\n"
                           "ID_LIKE=\"arch archlinux\"\n"
                           "BUILD_ID=rolling\n"));

      assert (r.name_id == "endeavouros");
      assert (r.like_ids == strings ({"arch", "archlinux"}));
      assert (r.version_id.empty ());
      assert (r.is_or_like ("arch"));

      ostringstream o;
      o << r;
      assert (o.str () == "EndeavourOS");
    }

    // Fallback values.
    //
    {
      os_release r (parse ("VERSION_ID=1\n"));

      assert (r.name_id == "linux");
      assert (r.name == "Linux");
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
