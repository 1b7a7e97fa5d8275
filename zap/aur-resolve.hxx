// file      : zap/aur-resolve.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef ZAP_AUR_RESOLVE_HXX
#define ZAP_AUR_RESOLVE_HXX

#include <zap/types.hxx>
#include <zap/utility.hxx>

#include <zap/package.hxx>

namespace zap
{
  // The information about the community registry packages and the host the
  // dependency resolution is based on.
  //
  class aur_dependency_source
  {
  public:
    // Return the dependency names declared by the package build descriptor.
    // Throw package_error if the descriptor cannot be fetched, extracted,
    // or parsed.
    //
    virtual strings
    descriptor_depends (const package&) = 0;

    virtual bool
    installed (const string& name) = 0;

    // Return true if the package is available from the primary (official)
    // repository and will therefore be pulled in by the system package
    // manager.
    //
    virtual bool
    in_primary_repository (const string& name) = 0;

    // Return the community registry record or nullopt if there is no such
    // package. Throw package_error if the registry query failed.
    //
    virtual optional<package>
    community_package (const string& name) = 0;

    virtual
    ~aur_dependency_source ();
  };

  // Return the community packages that must be built and installed for the
  // root package, in the discovery order, without duplicates, and excluding
  // the root itself as well as anything already installed or available from
  // the primary repository.
  //
  // The dependency graph is walked iteratively so that cycles and deep
  // chains are handled without recursion. If the descriptor of some package
  // cannot be obtained, then this is diagnosed with a warning and the
  // resolution continues with the rest of the graph.
  //
  packages
  resolve_aur_dependencies (aur_dependency_source&, const package& root);
}

#endif // ZAP_AUR_RESOLVE_HXX
