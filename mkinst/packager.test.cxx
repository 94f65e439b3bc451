// file      : mkinst/packager.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager.hxx>

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/document.hxx>
#include <mkinst/diagnostics.hxx>
#include <mkinst/test-utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace mkinst
{
  static int
  main ()
  {
    verb = 0;

    // Formats.
    //
    for (const char* n: {"mac_pkg", "mac_dmg", "deb", "rpm", "msi",
                         "makeself", "solaris"})
      assert (to_string (to_package_format (n)) == n);

    try
    {
      to_package_format ("pkgsrc");
      assert (false);
    }
    catch (const invalid_argument& e)
    {
      assert (string (e.what ()) == "unknown package format 'pkgsrc'");
    }

    // Fallback identifier.
    //
    assert (safe_token ("My $Project") == "myproject");
    assert (safe_token ("Joe's Software") == "joessoftware");
    assert (safe_token ("$%^") == "");

    {
      project p;
      p.name = "My $Project";
      p.maintainer = "Joe's Software";
      assert (fallback_identifier (p) == "test.joessoftware.pkg.myproject");
    }

    temp_dir td;

    configuration cfg;
    test_configuration (cfg, td.dir);

    project prj (test_project (td.dir));

    executor ex;
    executor::simulation sim;
    ex.simulate_ = &sim;

    // Factory.
    //
    for (package_format f: {package_format::mac_pkg,
                            package_format::mac_dmg,
                            package_format::deb,
                            package_format::rpm,
                            package_format::msi,
                            package_format::makeself,
                            package_format::solaris})
    {
      unique_ptr<packager> p (make_packager (f, prj, cfg, ex));
      assert (p->format () == f);
      assert (p->package_dir () == td.dir / dir_path ("pkg"));
      assert (p->tmp_dir () ==
              td.dir / dir_path ("pkg-tmp") / dir_path (to_string (f)));
    }

    // Path resolution creates the directories and cleans the temporary
    // directory.
    //
    {
      unique_ptr<packager> p (
        make_packager (package_format::makeself, prj, cfg, ex));

      p->resolve_paths ();
      assert (exists (p->package_dir ()));
      assert (exists (p->staging_dir ()));

      path stale (p->tmp_dir () / path ("stale"));
      touch (stale);

      p->resolve_paths ();
      assert (!exists (stale));
      assert (exists (p->staging_dir ()));
    }

    {
      configuration c;
      test_configuration (c, td.dir);

      path f (td.dir / path ("file"));
      touch (f);

      c.package_dir (path_cast<dir_path> (f));

      unique_ptr<packager> p (
        make_packager (package_format::makeself, prj, c, ex));

      try
      {
        p->resolve_paths ();
        assert (false);
      }
      catch (const path_resolution_error& e)
      {
        assert (e.path == path_cast<dir_path> (f));
      }
    }

    // Validation.
    //
    {
      project bad (prj);
      bad.version.clear ();

      unique_ptr<packager> p (
        make_packager (package_format::makeself, bad, cfg, ex));

      try
      {
        p->build ();
        assert (false);
      }
      catch (const missing_required_configuration& e)
      {
        assert (e.key == "version");
      }

      assert (sim.commands.empty ());
    }

    // Build with the simulated tool producing the artifact.
    //
    {
      unique_ptr<packager> p (
        make_packager (package_format::makeself, prj, cfg, ex));

      path a (td.dir / dir_path ("pkg") / path ("myproject-23.4.2-4.sh"));

      sim.effect = [&a] (const command_line&) {touch (a, "archive\n");};

      binary_files bs (p->build ());

      assert (bs.size () == 1);
      assert (bs[0].type == "makeself");
      assert (bs[0].path == a);
      assert (bs[0].sha256 == sha256_file (a));
      assert (bs[0].sha256.size () == 64);

      path m (a + ".metadata.json");
      assert (exists (m));

      string j (read_file (m));
      assert (j.find ("\"basename\":\"myproject-23.4.2-4.sh\"") != string::npos);
      assert (j.find ("\"format\":\"makeself\"") != string::npos);
      assert (j.find ("\"iteration\":4") != string::npos);
      assert (j.find ("\"license\":\"Unspecified\"") != string::npos);
      assert (j.find ("\"arch\":\"x86_64-linux-gnu\"") != string::npos);
      assert (j.find ("\"sha256\":\"" + bs[0].sha256 + '"') != string::npos);
      assert (j.back () == '\n');

      sim.commands.clear ();
      sim.effect = nullptr;

      rm (m);
      rm (a);
    }

    // Without metadata and without the artifact (dry run).
    //
    {
      unique_ptr<packager> p (
        make_packager (package_format::makeself, prj, cfg, ex));

      p->metadata (false);

      binary_files bs (p->build ());

      assert (bs.size () == 1);
      assert (bs[0].sha256.empty ());
      assert (!exists (bs[0].path));
      assert (!exists (bs[0].path + ".metadata.json"));
      assert (sim.commands.size () == 1);

      sim.commands.clear ();
    }

    // Tool failure propagates unchanged.
    //
    {
      unique_ptr<packager> p (
        make_packager (package_format::makeself, prj, cfg, ex));

      sim.failures["makeself"] = make_pair (1, string ("gzip: not found"));

      try
      {
        p->build ();
        assert (false);
      }
      catch (const external_tool_failure& e)
      {
        assert (e.program == "makeself");
        assert (e.output == "gzip: not found");
      }

      sim.failures.clear ();
      sim.commands.clear ();
    }

    // Architecture must be a valid target triplet.
    //
    {
      configuration c;
      test_configuration (c, td.dir);
      c.architecture ("x86_64");

      unique_ptr<packager> p (
        make_packager (package_format::deb, prj, c, ex));

      try
      {
        p->artifact_name ();
        assert (false);
      }
      catch (const missing_required_configuration& e)
      {
        assert (e.key == "architecture");
      }
    }

    return 0;
  }
}

int
main ()
{
  return mkinst::main ();
}
