// file      : mkinst/packager-rpm.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-rpm.hxx>

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
  static bool
  contains (const strings& ls, const string& l)
  {
    return find (ls.begin (), ls.end (), l) != ls.end ();
  }

  static int
  main ()
  {
    verb = 0;

    temp_dir td;

    configuration cfg;
    test_configuration (cfg, td.dir);

    project prj (test_project (td.dir));

    // Names.
    //
    {
      executor ex;
      packager_rpm p (prj, cfg, ex);

      assert (p.package_name () == "myproject");
      assert (p.package_version () == "23.4.2");
      assert (p.architecture () == "x86_64");
      assert (p.artifact_name () == "myproject-23.4.2-4.x86_64.rpm");

      assert (p.spec_path () ==
              p.tmp_dir () / dir_path ("SPECS") / path ("myproject.spec"));
      assert (p.rpms_path () ==
              p.tmp_dir () / dir_path ("RPMS/x86_64") /
              path ("myproject-23.4.2-4.x86_64.rpm"));

      prj.name = "My Project";
      prj.version = "1.0-rc1";
      assert (p.artifact_name () == "My-Project-1.0_rc1-4.x86_64.rpm");

      prj.rpm_identifier = "my_project";
      assert (p.package_name () == "my_project");

      prj.name = "myproject";
      prj.version = "23.4.2";
      prj.rpm_identifier = nullopt;

      cfg.architecture ("i386-linux-gnu");
      assert (p.architecture () == "i686");

      cfg.architecture ("aarch64-linux-gnu");
      assert (p.architecture () == "aarch64");

      cfg.architecture ("x86_64-linux-gnu");
    }

    // Commands.
    //
    {
      executor ex;
      packager_rpm p (prj, cfg, ex);

      command_line c (p.build_command ());
      assert (c.cwd () && *c.cwd () == p.tmp_dir ());
      assert (c.render () ==
              "rpmbuild --target x86_64 -bb"
              " --buildroot " + p.staging_dir ().string () +
              " --define \"_topdir " + p.tmp_dir ().string () + "\" " +
              p.spec_path ().string ());

      assert (!p.sign_command ());

      cfg.sign_pkg (true);
      assert (!p.sign_command ());

      cfg.signing_identity (optional<string> ("Joe Doe <joe@example.org>"));
      optional<command_line> s (p.sign_command ());
      assert (s);
      assert (s->render () ==
              "rpmsign --addsign"
              " --define \"_gpg_name Joe Doe <joe@example.org>\" " +
              p.artifact_path ().string ());

      cfg.sign_pkg (false);
      cfg.signing_identity (optional<string> ());
    }

    // Build.
    //
    {
      dir_path scripts (td.dir / dir_path ("scripts"));
      touch (scripts / path ("postinst"), "echo installed\n");
      touch (scripts / path ("prerm"), "echo removing\n");
      prj.package_scripts_path = scripts;
      prj.description = "The project.\nSecond line.";

      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_rpm p (prj, cfg, ex);

      // Produce the package where rpmbuild would.
      //
      sim.effect = [&p] (const command_line& c)
      {
        if (c.program () == "rpmbuild")
          touch (p.rpms_path (), "rpm");
      };

      binary_files bs (p.build ());
      assert (bs.size () == 1);
      assert (bs[0].path == p.artifact_path ());
      assert (read_file (p.artifact_path ()) == "rpm");
      assert (!exists (p.rpms_path ()));

      text_document d;
      d.append (read_file (p.spec_path ()));
      const strings& ls (d.lines ());

      assert (ls.front () == "%define __spec_prep_post true");
      assert (contains (ls, "Name: myproject"));
      assert (contains (ls, "Version: 23.4.2"));
      assert (contains (ls, "Release: 4"));
      assert (contains (ls, "Summary: Myproject"));
      assert (contains (ls, "BuildArch: x86_64"));
      assert (contains (ls, "License: Unspecified"));
      assert (contains (ls, "Vendor: Joe Doe <joe@example.org>"));
      assert (contains (ls, "Packager: Joe Doe <joe@example.org>"));
      assert (!contains (ls, "%pre"));
      assert (!contains (ls, "%postun"));

      auto at = [&ls] (const string& l)
      {
        return find (ls.begin (), ls.end (), l) - ls.begin ();
      };

      assert (ls[at ("%description") + 1] == "The project.");
      assert (ls[at ("%description") + 2] == "Second line.");
      assert (ls[at ("%post") + 1] == "echo installed");
      assert (ls[at ("%preun") + 1] == "echo removing");
      assert (at ("%prep") < at ("%post"));

      const string inst (prj.install_dir.string ());

      assert (ls[at ("%files") + 1] == "%defattr(-,root,root,-)");
      assert (ls[at ("%files") + 2] == "%dir \"" + inst + '"');
      assert (contains (ls, "%dir \"" + inst + "/bin\""));
      assert (contains (ls, '"' + inst + "/bin/myproject\""));
      assert (contains (ls, "%dir \"" + inst + "/share/doc\""));
      assert (contains (ls, '"' + inst + "/share/doc/README\""));
      assert (ls.back () == '"' + inst + "/share/doc/README\"");

      assert (rendered (sim) == strings {p.build_command ().render ()});

      prj.package_scripts_path = dir_path ();
      prj.description = nullopt;
    }

    // Signing after the move.
    //
    {
      cfg.sign_pkg (true);
      cfg.signing_identity (optional<string> ("builder"));

      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_rpm p (prj, cfg, ex);
      p.build ();

      strings cs (rendered (sim));
      assert (cs.size () == 2);
      assert (cs[1] ==
              "rpmsign --addsign --define \"_gpg_name builder\" " +
              p.artifact_path ().string ());

      cfg.sign_pkg (false);
    }

    // Unrepresentable value.
    //
    {
      prj.license = "MIT\nGPL";

      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_rpm p (prj, cfg, ex);

      try
      {
        p.build ();
        assert (false);
      }
      catch (const document_generation_error&) {}

      assert (sim.commands.empty ());
    }

    return 0;
  }
}

int
main ()
{
  return mkinst::main ();
}
