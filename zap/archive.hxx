// file      : zap/archive.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_ARCHIVE_HXX
#define ZAP_ARCHIVE_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/zap-options.hxx>

namespace zap
{
  // Start the process of extracting the archive to the specified directory.
  //
  // Return a pair of processes that form a pipe (decompressor and tar). Wait
  // on the second first. Throw package_error (build) if the compression
  // method is unknown.
  //
  pair<process, process>
  start_extract (const common_options&,
                 const path& archive,
                 const dir_path&);

  // Start as above and wait for the extraction to complete. Throw
  // package_error (build) if any of the processes fail.
  //
  void
  extract (const common_options&, const path& archive, const dir_path&);
}

#endif // ZAP_ARCHIVE_HXX
