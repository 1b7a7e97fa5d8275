// file      : zap/cmd-query.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_CMD_QUERY_HXX
#define ZAP_CMD_QUERY_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package.hxx>
#include <zap/zap-options.hxx>

namespace zap
{
  int
  cmd_search (const search_options&, cli::scanner& args);

  int
  cmd_info (const info_options&, cli::scanner& args);

  int
  cmd_list (const list_options&, cli::scanner& args);

  // Print the package details in the `<field>: <value>` form, one field per
  // line, each line starting with the indentation.
  //
  void
  print_package_details (ostream&, const package&, const char* indent);
}

#endif // ZAP_CMD_QUERY_HXX
