// file      : zap/help.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/help.hxx>

#include <libbutl/pager.hxx>

#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  int
  help (const string& c, usage_function* usage)
  {
    try
    {
      pager p ("zap " + (c.empty () ? "help" : c), verb >= 2);
      ostream& os (p.stream ());

      if (usage != nullptr)
      {
        os << "usage: zap " << c << " [<options>] <args>" << endl
           << endl;

        usage (os, cli::usage_para::none);
      }
      else
      {
        os << "usage: zap [<common-options>] <command> [<command-options>] "
           << "<args>" << endl
           << endl;

        cli::usage_para u (commands::print_usage (os));
        common_options::print_usage (os, u);
      }

      // If the pager failed, assume it has issued some diagnostics.
      //
      return p.wait () ? 0 : 1;
    }
    // Catch io_error as std::system_error together with the pager-specific
    // exceptions.
    //
    catch (const system_error& e)
    {
      error << "pager failed: " << e;

      // Fall through.
    }

    throw failed ();
  }
}
