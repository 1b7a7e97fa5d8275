// file      : zap/package.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_PACKAGE_HXX
#define ZAP_PACKAGE_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

namespace zap
{
  // Backend-specific package metadata. Only the community backend fills in
  // most of it.
  //
  struct package_extra
  {
    optional<uint64_t> aur_id;      // ID
    optional<uint64_t> aur_votes;   // NumVotes

    // Source snapshot path relative to the community registry URL, for
    // example, /cgit/aur.git/snapshot/yay.tar.gz. Absent means the package
    // cannot be built.
    //
    optional<string>   url_path;    // URLPath

    optional<uint64_t> out_of_date; // OutOfDate (UNIX time)

    // Raw dependency declarations, possibly with version constraints (for
    // example, glibc>=2.38). Use clean_dependency_name() to normalize.
    //
    strings depends;

    strings license;

    optional<string> repository; // core, extra, main, universe, etc.
  };

  // A package as reported by a backend. The popularity is normalized to
  // [0, 100] but is not comparable across backends. The installed flag is
  // advisory.
  //
  struct package
  {
    string           name;
    string           version;
    optional<string> description;
    double           popularity = 0;
    bool             installed = false;
    optional<string> maintainer;
    optional<string> url;

    package_extra    extra;

    package () = default;

    package (string n, string v)
        : name (move (n)), version (move (v)) {}
  };

  using packages = vector<package>;

  // Outcome of installing a single requested package.
  //
  struct install_result
  {
    string           package;
    bool             success;
    optional<string> message;

    install_result (string p, bool s, optional<string> m = nullopt)
        : package (move (p)), success (s), message (move (m)) {}
  };

  using install_results = vector<install_result>;

  // Per-package failure. Thrown by the backends and the build pipeline and
  // caught at the batch boundary, where it becomes the failed
  // install_result's message. The diagnostics is not issued.
  //
  enum class package_error_kind
  {
    network,  // Download or registry query failed.
    parse,    // Unexpected output or descriptor format.
    build,    // Build or privileged install failed.
    not_found // No such package.
  };

  string
  to_string (package_error_kind);

  class package_error: public runtime_error
  {
  public:
    package_error (package_error_kind k, const string& d)
        : runtime_error (d), kind (k) {}

    package_error_kind kind;
  };
}

#endif // ZAP_PACKAGE_HXX
