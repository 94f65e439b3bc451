// file      : mkinst/packager-makeself.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-makeself.hxx>

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/document.hxx>
#include <mkinst/diagnostics.hxx>
#include <mkinst/test-utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;

namespace mkinst
{
  static int
  main ()
  {
    verb = 0;

    temp_dir td;

    configuration cfg;
    test_configuration (cfg, td.dir);

    project prj (test_project (td.dir));
    prj.friendly_name = "My Project";

    // Names and command.
    //
    {
      executor ex;
      packager_makeself p (prj, cfg, ex);

      assert (p.artifact_name () == "myproject-23.4.2-4.sh");
      assert (p.staging_dir () == p.tmp_dir () / dir_path ("staging"));
      assert (p.payload_dir () == p.staging_dir () / dir_path ("payload"));

      command_line c (p.build_command ());
      assert (c.cwd () && *c.cwd () == p.tmp_dir ());
      assert (c.render () ==
              "makeself --gzip " + p.staging_dir ().string () + ' ' +
              p.artifact_path ().string () + " \"My Project\" ./makeselfinst");
    }

    // Install script.
    //
    {
      executor ex;
      packager_makeself p (prj, cfg, ex);

      const dir_path d (prj.install_dir);
      prj.install_dir = dir_path ("/opt/my project");

      text_document s (p.install_script ());
      const strings& ls (s.lines ());

      assert (ls.front () == "#!/bin/sh");
      assert (ls[2] ==
              "# Install My Project 23.4.2-4 into /opt/my project.");
      assert (find (ls.begin (), ls.end (),
                    "INSTALL_DIR=\"/opt/my project\"") != ls.end ());
      assert (find (ls.begin (), ls.end (),
                    "cp -R ./payload/. \"$INSTALL_DIR\"") != ls.end ());
      assert (find (ls.begin (), ls.end (),
                    "  INSTALL_DIR=\"$INSTALL_DIR\" sh ./postinst") !=
              ls.end ());

      prj.install_dir = d;
    }

    // Build.
    //
    {
      dir_path scripts (td.dir / dir_path ("scripts"));
      touch (scripts / path ("postinst"), "echo done\n");
      touch (scripts / path ("prerm"), "echo removing\n");
      prj.package_scripts_path = scripts;

      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_makeself p (prj, cfg, ex);
      p.build ();

      // The payload is the installation directory contents.
      //
      assert (exists (p.payload_dir () / dir_path ("bin") /
                      path ("myproject")));
      assert (exists (p.payload_dir () / dir_path ("share/doc") /
                      path ("README")));

      assert (read_file (p.staging_dir () / path ("postinst")) ==
              "echo done\n");
      assert (!exists (p.staging_dir () / path ("prerm")));

      assert (read_file (p.install_script_path ()) ==
              p.install_script ().render ());

#ifndef _WIN32
      assert (path_permissions (p.install_script_path ()) ==
              script_permissions);
#endif

      assert (rendered (sim) == strings {p.build_command ().render ()});
    }

    return 0;
  }
}

int
main ()
{
  return mkinst::main ();
}
