// file      : zap/help.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_HELP_HXX
#define ZAP_HELP_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/zap-options.hxx>

namespace zap
{
  using usage_function = cli::usage_para (ostream&, cli::usage_para);

  // Print the usage for the command through the pager. If usage is NULL,
  // then print the general help.
  //
  int
  help (const string& command, usage_function*);
}

#endif // ZAP_HELP_HXX
