// file      : zap/json.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_JSON_HXX
#define ZAP_JSON_HXX

#include <libbutl/json/parser.hxx>

#include <zap/types.hxx>
#include <zap/utility.hxx>

namespace zap
{
  namespace json = butl::json;

  // Return true if the next event is the specified one.
  //
  inline bool
  peek_json (json::parser& p, json::event e)
  {
    optional<json::event> x (p.peek ());
    return x && *x == e;
  }

  // Helpers for the registry payloads where a member can be null or of an
  // unexpected type. Each consumes the next value, skipping it if it is not
  // of the expected type.
  //
  // String (or number in its textual representation).
  //
  optional<string>
  next_json_string (json::parser&);

  optional<uint64_t>
  next_json_uint (json::parser&);

  optional<double>
  next_json_double (json::parser&);

  // Array of strings. Non-string elements are skipped and anything other
  // than an array yields an empty list.
  //
  strings
  next_json_strings (json::parser&);
}

#endif // ZAP_JSON_HXX
