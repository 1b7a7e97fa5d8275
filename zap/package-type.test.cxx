// file      : zap/package-type.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-type.hxx>

#include <sstream>

#include <zap/types.hxx>
#include <zap/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  int
  main ()
  {
    assert (classify_package ("@scope/pkg") == package_type::npm);
    assert (classify_package ("@types/node") == package_type::npm);

    assert (classify_package ("github.com/org/tool") == package_type::go);
    assert (classify_package ("golang.org/x/tools/gopls") == package_type::go);
    assert (classify_package ("gopkg.in/yaml.v3") == package_type::go);

    assert (classify_package ("deno.land/std") == package_type::npm);
    assert (classify_package ("lodash/fp") == package_type::npm);

    assert (classify_package ("redis") == package_type::unknown);
    assert (classify_package ("python-requests") == package_type::unknown);
    assert (classify_package ("") == package_type::unknown);

    {
      ostringstream os;
      os << package_type::go << ' ' << package_type::unknown;
      assert (os.str () == "go unknown");
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
