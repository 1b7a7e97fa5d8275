// file      : zap/package.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package.hxx>

namespace zap
{
  string
  to_string (package_error_kind k)
  {
    switch (k)
    {
    case package_error_kind::network:   return "network error";
    case package_error_kind::parse:     return "parse error";
    case package_error_kind::build:     return "build error";
    case package_error_kind::not_found: return "not found";
    }

    return string (); // Should never reach.
  }
}
