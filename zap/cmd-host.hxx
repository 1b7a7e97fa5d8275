// file      : zap/cmd-host.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_CMD_HOST_HXX
#define ZAP_CMD_HOST_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/zap-options.hxx>

namespace zap
{
  int
  cmd_managers (const managers_options&, cli::scanner& args);

  int
  cmd_system (const system_options&, cli::scanner& args);
}

#endif // ZAP_CMD_HOST_HXX
