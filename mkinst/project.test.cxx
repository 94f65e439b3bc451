// file      : mkinst/project.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/project.hxx>

#include <sstream>

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/diagnostics.hxx>
#include <mkinst/test-utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace mkinst
{
  static project
  parse (const string& s, const path& f = path ("/src/project.manifest"))
  {
    istringstream is (s);
    return parse_project (is, f);
  }

  static bool
  parse_fails (const string& s)
  {
    try
    {
      parse (s);
      return false;
    }
    catch (const failed&)
    {
      return true;
    }
  }

  static string
  missing_key (const string& s)
  {
    try
    {
      parse (s);
      return string ();
    }
    catch (const missing_required_configuration& e)
    {
      return e.key;
    }
  }

  static int
  main ()
  {
    verb = 0;

    const string required (
      ": 1\n"
      "name: myproject\n"
      "maintainer: Joe Doe <joe@example.org>\n"
      "version: 23.4.2\n"
      "install-dir: /opt/myproject\n");

    // Defaults.
    //
    {
      project p (parse (required));

      assert (p.name == "myproject");
      assert (p.friendly_name == "myproject");
      assert (p.maintainer == "Joe Doe <joe@example.org>");
      assert (p.version == "23.4.2");
      assert (p.iteration == 1);
      assert (p.install_dir == dir_path ("/opt/myproject"));
      assert (p.files_path.empty ());
      assert (p.package_scripts_path.empty ());
      assert (p.license == "Unspecified");
      assert (!p.homepage && !p.description && !p.vendor);
      assert (!p.mac_pkg_identifier && !p.msi_identifier);
    }

    // All values.
    //
    {
      project p (parse (required +
                        "friendly-name: My Project\n"
                        "iteration: 4\n"
                        "files-path: files\n"
                        "package-scripts-path: /omnibus/project/root/scripts\n"
                        "homepage: https://example.org/myproject\n"
                        "description: The project.\n"
                        "license: MIT\n"
                        "vendor: Example Inc\n"
                        "mac-pkg-identifier: com.mycorp.myproject\n"
                        "deb-identifier: my-project\n"
                        "rpm-identifier: my_project\n"
                        "msi-identifier: 2CD7259C-776D-4DDB-A4C8-6E544E580AA1\n"
                        "solaris-identifier: myproj\n"));

      assert (p.friendly_name == "My Project");
      assert (p.iteration == 4);
      assert (p.files_path == dir_path ("/src/files"));
      assert (p.package_scripts_path ==
              dir_path ("/omnibus/project/root/scripts"));
      assert (*p.homepage == "https://example.org/myproject");
      assert (*p.description == "The project.");
      assert (p.license == "MIT");
      assert (*p.vendor == "Example Inc");
      assert (*p.mac_pkg_identifier == "com.mycorp.myproject");
      assert (*p.deb_identifier == "my-project");
      assert (*p.rpm_identifier == "my_project");
      assert (*p.msi_identifier == "2CD7259C-776D-4DDB-A4C8-6E544E580AA1");
      assert (*p.solaris_identifier == "myproj");
    }

    // Missing required values.
    //
    assert (missing_key (": 1\n"
                         "maintainer: Joe Doe <joe@example.org>\n"
                         "version: 1\n"
                         "install-dir: /opt/x\n") == "name");

    assert (missing_key (": 1\n"
                         "name: x\n"
                         "maintainer: Joe Doe <joe@example.org>\n"
                         "install-dir: /opt/x\n") == "version");

    assert (missing_key (": 1\n"
                         "name: x\n"
                         "version: 1\n"
                         "install-dir: /opt/x\n") == "maintainer");

    assert (missing_key (": 1\n"
                         "name: x\n"
                         "version: 1\n"
                         "maintainer: Joe Doe <joe@example.org>\n") ==
            "install-dir");

    // Invalid manifests.
    //
    assert (parse_fails (required + "name: other\n"));
    assert (parse_fails (required + "iteration: 4a\n"));
    assert (parse_fails (required + "iteration: 99999999999999999999999\n"));
    assert (parse_fails (required + "colour: blue\n"));
    assert (parse_fails (required + "homepage:\n"));
    assert (parse_fails (": 1\n"
                         "name: x\n"
                         "version: 1\n"
                         "maintainer: Joe Doe <joe@example.org>\n"
                         "install-dir: opt/x\n"));
    assert (parse_fails (": 2\n"));
    assert (parse_fails ("name: x\n"));
    assert (parse_fails (required + ":\n" + required));

    // Loading from a file.
    //
    {
      temp_dir td;
      path f (td.dir / path ("project.manifest"));
      touch (f, required + "files-path: files\n");

      project p (load_project (f));
      assert (p.name == "myproject");
      assert (p.files_path == td.dir / dir_path ("files"));

      try
      {
        load_project (td.dir / path ("no-such-file"));
        assert (false);
      }
      catch (const failed&) {}
    }

    return 0;
  }
}

int
main ()
{
  return mkinst::main ();
}
