// file      : zap/package-type.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-type.hxx>

namespace zap
{
  string
  to_string (package_type t)
  {
    switch (t)
    {
    case package_type::system:  return "system";
    case package_type::npm:     return "npm";
    case package_type::pip:     return "pip";
    case package_type::cargo:   return "cargo";
    case package_type::go:      return "go";
    case package_type::unknown: return "unknown";
    }

    return string (); // Should never reach.
  }

  static inline bool
  prefixed (const string& n, const string& p)
  {
    return n.compare (0, p.size (), p) == 0;
  }

  package_type
  classify_package (const string& n)
  {
    if (n[0] == '@')
      return package_type::npm;

    if (prefixed (n, "github.com/") ||
        prefixed (n, "golang.org/") ||
        prefixed (n, "gopkg.in/"))
      return package_type::go;

    // Deno modules are handled by the npm-compatible backends.
    //
    if (prefixed (n, "deno.land/"))
      return package_type::npm;

    if (n.find ('/') != string::npos)
      return package_type::npm;

    return package_type::unknown;
  }
}
