// file      : zap/package-manager-npm.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/package-manager-npm.hxx>

#include <zap/types.hxx>
#include <zap/utility.hxx>
#include <zap/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace zap
{
  using pm = package_manager_npm;

  int
  main ()
  {
    verb = 0;

    {
      packages ps (pm::parse_search (R"({
        "objects": [
          {
            "package": {
              "name": "typescript",
              "scope": "unscoped",
              "version": "5.5.4",
              "description": "TypeScript is a language",
              "keywords": ["TypeScript", "Microsoft"],
              "links": {
                "npm": "https://www.npmjs.com/package/typescript",
                "homepage": "https://www.typescriptlang.org/"
              },
              "publisher": {"username": "typescript-bot",
                            "email": "ts@example.org"}
            },
            "score": {
              "final": 0.9,
              "detail": {"quality": 0.8, "popularity": 0.75, "maintenance": 1}
            },
            "searchScore": 100000.01
          },
          {
            "package": {
              "name": "@types/node",
              "version": "22.0.0",
              "description": null,
              "links": {"npm": "https://www.npmjs.com/package/@types/node"},
              "publisher": {"email": "types@example.org"}
            },
            "score": {"detail": {"popularity": 1}}
          }
        ],
        "total": 2,
        "time": "Mon Jul 29 2024 10:00:00 GMT+0000"
      })"));

      assert (ps.size () == 2);

      assert (ps[0].name == "typescript" && ps[0].version == "5.5.4");
      assert (*ps[0].url == "https://www.typescriptlang.org/");
      assert (*ps[0].maintainer == "typescript-bot");
      assert (ps[0].popularity == 75);

      assert (ps[1].name == "@types/node");
      assert (!ps[1].description);
      assert (*ps[1].url == "https://www.npmjs.com/package/@types/node");
      assert (*ps[1].maintainer == "types@example.org");
      assert (ps[1].popularity == 100);
    }

    {
      optional<package> p (pm::parse_manifest (R"({
        "name": "left-pad",
        "version": "1.3.0",
        "description": "String left pad",
        "license": "WTFPL",
        "repository": {"type": "git",
                       "url": "git+https://github.com/stevemao/left-pad.git"},
        "dependencies": {"a": "^1.0.0", "b": "~2.0.0"},
        "maintainers": [{"name": "stevemao", "email": "s@example.org"}],
        "dist": {"shasum": "5b8a3a7765dfe001261dde915589e782f8c94d1e"}
      })"));

      assert (p);
      assert (p->name == "left-pad" && p->version == "1.3.0");
      assert (*p->url == "git+https://github.com/stevemao/left-pad.git");
      assert ((p->extra.license == strings {"WTFPL"}));
      assert ((p->extra.depends == strings {"a", "b"}));
      assert (*p->maintainer == "stevemao");

      p = pm::parse_manifest (R"({"name": "x", "version": "1.0.0"})");
      assert (p && *p->url == "https://www.npmjs.com/package/x");

      assert (!pm::parse_manifest (R"({"error": "Not found"})"));
    }

    {
      installed_packages is (pm::parse_list (R"({
        "name": "lib",
        "dependencies": {
          "npm": {"version": "10.8.2", "overridden": false},
          "typescript": {"version": "5.5.4"},
          "broken": {"missing": true}
        }
      })"));

      assert (is.size () == 2);
      assert (is[0].first == "npm" && is[0].second == "10.8.2");
      assert (is[1].first == "typescript");
    }

    {
      packages ps (pm::parse_outdated (R"({
        "typescript": {"current": "5.4.0", "wanted": "5.5.4",
                       "latest": "5.5.4",
                       "location": "/usr/lib/node_modules/typescript"}
      })"));

      assert (ps.size () == 1);
      assert (ps[0].name == "typescript" && ps[0].version == "5.5.4");
      assert (ps[0].installed);

      assert (pm::parse_outdated ("").empty ());
      assert (pm::parse_outdated ("\n").empty ());
    }

    try
    {
      pm::parse_search ("{\"objects\": [");
      assert (false);
    }
    catch (const package_error& e)
    {
      assert (e.kind == package_error_kind::parse);
    }

    // Batched global install.
    //
    {
      common_options co;

      package_manager::simulation s;
      s.failures.push_back ({"npm", "update", "-g", "eslint"});

      package_manager_npm p (co);
      p.simulate_ = &s;

      install_results rs (p.install ({package ("typescript", "5.5.4"),
                                      package ("@scope/z", "1.0.0")}));

      assert (rs.size () == 2 && rs[0].success && rs[1].success);
      assert ((s.commands[0] ==
               strings {"npm", "install", "-g", "typescript", "@scope/z"}));

      rs = p.update ({package ("eslint", "9.0.0")});
      assert (rs.size () == 1 && !rs[0].success);
    }

    return 0;
  }
}

int
main ()
{
  return zap::main ();
}
