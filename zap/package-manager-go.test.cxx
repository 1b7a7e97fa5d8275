// file      : zap/package-manager-go.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-go.hxx>

#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  using pm = package_manager_go;

  int
  main ()
  {
    verb = 0;

    assert (pm::escape_module_path ("github.com/BurntSushi/toml") ==
            "github.com/!burnt!sushi/toml");
    assert (pm::escape_module_path ("golang.org/x/tools") ==
            "golang.org/x/tools");

    assert (pm::binary_name ("golang.org/x/tools/gopls@latest") == "gopls");
    assert (pm::binary_name ("github.com/x/y") == "y");
    assert (pm::binary_name ("github.com/x/tool/v2@v2.1.0") == "tool");
    assert (pm::binary_name ("github.com/x/y/") == "y");
    assert (pm::binary_name ("gofmt") == "gofmt");

    assert (*pm::parse_latest (
              R"({"Version": "v0.16.1", "Time": "2024-07-01T12:00:00Z"})") ==
            "v0.16.1");
    assert (!pm::parse_latest (R"({"Version": ""})"));
    assert (!pm::parse_latest (R"({"Time": "2024-07-01T12:00:00Z"})"));

    try
    {
      pm::parse_latest ("not found: unknown revision");
      assert (false);
    }
    catch (const package_error& e)
    {
      assert (e.kind == package_error_kind::parse);
    }

    // Install with the resolved or requested versions and update to the
    // latest.
    //
    {
      common_options co;

      package_manager::simulation s;
      s.failures.push_back ({"go", "install", "example.org/broken@latest"});

      package_manager_go p (co);
      p.simulate_ = &s;

      install_results rs (
        p.install ({package ("github.com/x/y", "v1.0.0"),
                    package ("golang.org/x/tools/gopls@v0.16.0", "v0.16.0"),
                    package ("example.org/broken", "")}));

      assert (rs.size () == 3);
      assert (rs[0].success && rs[1].success && !rs[2].success);

      assert ((s.commands ==
               vector<strings> {
                 {"go", "install", "github.com/x/y@v1.0.0"},
                 {"go", "install", "golang.org/x/tools/gopls@v0.16.0"},
                 {"go", "install", "example.org/broken@latest"}}));

      s.commands.clear ();

      rs = p.update ({package ("github.com/x/y@v1.0.0", "v1.0.0")});

      assert (rs.size () == 1 && rs[0].success);
      assert ((s.commands[0] ==
               strings {"go", "install", "github.com/x/y@latest"}));

      assert (p.check_updates ().empty ());
      assert (p.search ("y").empty ());
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
