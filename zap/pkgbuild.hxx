// file      : zap/pkgbuild.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PKGBUILD_HXX
#define ZAP_PKGBUILD_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

namespace zap
{
  // Extract the dependency names from the PKGBUILD build descriptor.
  //
  // Only the depends, makedepends, and checkdepends declarations (including
  // their architecture-specific variants, such as depends_x86_64, and the +=
  // append form) are considered. Both the array and scalar assignments are
  // recognized:
  //
  // depends=('glibc>=2.38' "gtk3"
  //          libnotify)   # Notifications.
  // makedepends+=(go)
  // checkdepends=python
  //
  // Outside quotes unescaped whitespace delimits tokens and a backslash
  // escapes the next character. Blank and #-comment lines are skipped
  // everywhere except inside a quoted token. Inside an array a token that
  // starts with # begins a comment that runs until the end of the line.
  //
  // Every collected token has its version constraint stripped (see
  // clean_dependency_name() below) and empty tokens are dropped. A quoted
  // token that is still open at the end of input is dropped as well.
  //
  // Note that the PKGBUILD is a bash script and no attempt is made to expand
  // variables or evaluate anything.
  //
  strings
  parse_pkgbuild_depends (const string& text);

  // As above but read the PKGBUILD file. Return an empty list if the file
  // does not exist. Throw package_error (parse) on the read error.
  //
  strings
  read_pkgbuild_depends (const path&);

  // Strip the version constraint from the dependency declaration, for
  // example, glibc>=2.38 becomes glibc. Return empty string if nothing
  // remains (or the declaration only consists of parenthesis).
  //
  string
  clean_dependency_name (const string&);
}

#endif // ZAP_PKGBUILD_HXX
