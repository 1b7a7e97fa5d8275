// file      : zap/cmd-install.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_CMD_INSTALL_HXX
#define ZAP_CMD_INSTALL_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package.hxx>
#include <zap/zap-options.hxx>

namespace zap
{
  // Return 0 if every package was installed successfully and 1 otherwise.
  //
  int
  cmd_install (const install_options&, cli::scanner& args);

  int
  cmd_update (const update_options&, cli::scanner& args);

  // Print the per-package outcome table:
  //
  // package  status     message
  // htop     installed
  // foo      failed     not found in any backend
  //
  void
  print_install_summary (ostream&, const install_results&);
}

#endif // ZAP_CMD_INSTALL_HXX
