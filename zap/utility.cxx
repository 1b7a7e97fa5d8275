// file      : zap/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/utility.hxx>

#include <libbutl/prompt.hxx>
#include <libbutl/fdstream.hxx>

#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  static dir_path
  xdg_dir (const char* var, const char* fallback)
  {
    if (optional<string> v = getenv (var))
    {
      try
      {
        dir_path d (move (*v));

        // Relative values are invalid and must be ignored.
        //
        if (d.absolute ())
          return d;
      }
      catch (const invalid_path&)
      {
        // Fall through.
      }
    }

    try
    {
      return dir_path::home_directory () / dir_path (fallback);
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain home directory: " << e << endf;
    }
  }

  dir_path
  config_home ()
  {
    return xdg_dir ("XDG_CONFIG_HOME", ".config");
  }

  dir_path
  cache_home ()
  {
    return xdg_dir ("XDG_CACHE_HOME", ".cache");
  }

  optional<const char*> stderr_term = nullopt;

  bool
  yn_prompt (const string& p, char d)
  {
    try
    {
      return butl::yn_prompt (p, d);
    }
    catch (io_error&)
    {
      fail << "unable to read y/n answer from stdin" << endf;
    }
  }

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  bool
  find_program (const char* p)
  {
    return !process::try_path_search (p, false /* init */, exec_dir).empty ();
  }

  dir_path exec_dir;
}
