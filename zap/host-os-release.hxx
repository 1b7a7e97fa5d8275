// file      : zap/host-os-release.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_HOST_OS_RELEASE_HXX
#define ZAP_HOST_OS_RELEASE_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

namespace zap
{
  // Information extracted from /etc/os-release on Linux. See os-release(5)
  // for background. Some examples:
  //
  // {"arch", {}, "", "",
  //  "Arch Linux", "", ""}
  //
  // {"debian", {}, "12", "",
  //  "Debian GNU/Linux", "bookworm", ""}
  //
  // {"ubuntu", {"debian"}, "22.04", "",
  //  "Ubuntu", "jammy", ""}
  //
  // {"endeavouros", {"arch"}, "", "",
  //  "EndeavourOS", "", ""}
  //
  // Note that version_id is normally empty on rolling release distributions.
  //
  struct os_release
  {
    string         name_id;    // ID
    vector<string> like_ids;   // ID_LIKE
    string         version_id; // VERSION_ID
    string         variant_id; // VARIANT_ID

    string name;             // NAME
    string version_codename; // VERSION_CODENAME
    string variant;          // VARIANT

    // Return true if the distribution is name_id or is like name_id.
    //
    bool
    is_or_like (const char* id) const;
  };

  // Return the release information for the host or nullopt if the host is
  // not Linux.
  //
  optional<os_release>
  host_os_release ();

  // As above but read the information from the specified file rather than
  // from /etc/os-release (or /usr/lib/os-release).
  //
  os_release
  host_os_release_linux (path = {});

  // Print the release information in the "$name $version ($codename)" form.
  //
  ostream&
  operator<< (ostream&, const os_release&);
}

#endif // ZAP_HOST_OS_RELEASE_HXX
