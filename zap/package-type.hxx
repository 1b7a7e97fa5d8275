// file      : zap/package-type.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_TYPE_HXX
#define ZAP_PACKAGE_TYPE_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

namespace zap
{
  // Coarse package ecosystem hint derived from the package name.
  //
  enum class package_type
  {
    system,
    npm,
    pip,
    cargo,
    go,
    unknown
  };

  string
  to_string (package_type);

  inline ostream&
  operator<< (ostream& os, package_type t)
  {
    return os << to_string (t);
  }

  // Classify the package name. The rules are applied in order:
  //
  // @scope/name                                  -> npm
  // github.com/..., golang.org/..., gopkg.in/... -> go
  // deno.land/...                                -> npm
  // any other name containing '/'                -> npm
  // anything else                                -> unknown
  //
  // Note that a bare name (for example, redis) is unknown rather than system
  // since it can be provided by any backend.
  //
  package_type
  classify_package (const string& name);
}

#endif // ZAP_PACKAGE_TYPE_HXX
