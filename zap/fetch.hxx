// file      : zap/fetch.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_FETCH_HXX
#define ZAP_FETCH_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package.hxx>
#include <zap/zap-options.hxx>

namespace zap
{
  // Start the process of fetching the specified URL. If out is empty, then
  // fetch to stdout (which the caller reads from process::in_ofd). In this
  // case also don't show any progress unless we are running verbose. If
  // user_agent is empty, then send ZAP_USER_AGENT followed by the fetch
  // program name.
  //
  // The fetch program exits with non-zero status on HTTP errors (for
  // example, 404) so the caller only needs to check the process exit status.
  //
  process
  start_fetch (const common_options&,
               const string& url,
               const path& out = {},
               const string& user_agent = {});

  // Fetch the specified URL into the file, blocking until done. Throw
  // package_error (network) if the fetch program fails.
  //
  void
  fetch_file (const common_options&, const string& url, const path& out);

  // Fetch the specified URL returning its contents. Throw package_error
  // (network) if the fetch program fails.
  //
  string
  fetch_text (const common_options&, const string& url);

  // Percent-encode all the characters except the unreserved ones. If query
  // is true, then encode space as '+'.
  //
  string
  url_encode (const string&, bool query = true);
}

#endif // ZAP_FETCH_HXX
