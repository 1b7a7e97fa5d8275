// file      : zap/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef ZAP_TYPES_PARSERS_HXX
#define ZAP_TYPES_PARSERS_HXX

#include <zap/types.hxx>

#include <zap/zap-options.hxx> // zap::cli namespace

namespace zap
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };
  }
}

#endif // ZAP_TYPES_PARSERS_HXX
