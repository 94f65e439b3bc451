// file      : mkinst/packager-solaris.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-solaris.hxx>

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

    temp_dir td;

    configuration cfg;
    test_configuration (cfg, td.dir);

    project prj (test_project (td.dir));

    // Names.
    //
    {
      executor ex;
      packager_solaris p (prj, cfg, ex);

      assert (p.package_name () == "myproject");
      assert (p.architecture () == "i386");
      assert (p.artifact_name () == "myproject-23.4.2-4.i386.solaris");

      prj.name = "My Very Long Project Name With Many Words";
      assert (p.package_name () == "myverylongprojectnamewithmanywor");
      assert (p.package_name ().size () == 32);

      prj.name = "$$$";
      try
      {
        p.validate ();
        assert (false);
      }
      catch (const missing_required_configuration& e)
      {
        assert (e.key == "solaris-identifier");
      }

      prj.solaris_identifier = "MYproj";
      assert (p.package_name () == "MYproj");
      p.validate ();

      prj.name = "myproject";
      prj.solaris_identifier = nullopt;

      cfg.architecture ("sparcv9-sun-solaris2.11");
      assert (p.architecture () == "sparc");

      cfg.architecture ("x86_64-linux-gnu");
    }

    // pkginfo.
    //
    {
      executor ex;
      packager_solaris p (prj, cfg, ex);

      assert (p.pkginfo ().render () ==
              "CLASSES=none\n"
              "TZ=PST\n"
              "PATH=/sbin:/usr/sbin:/usr/bin:/usr/sadm/install/bin\n"
              "BASEDIR=/\n"
              "PKG=myproject\n"
              "NAME=Myproject\n"
              "ARCH=i386\n"
              "VERSION=23.4.2-4\n"
              "CATEGORY=application\n"
              "DESC=Myproject\n"
              "VENDOR=Joe Doe <joe@example.org>\n"
              "EMAIL=Joe Doe <joe@example.org>\n");
    }

    // Commands.
    //
    {
      executor ex;
      packager_solaris p (prj, cfg, ex);

      vector<command_line> cs (p.commands ());
      assert (cs.size () == 2);

      assert (cs[0].render () ==
              "pkgmk -o -r " + p.staging_dir ().string () +
              " -d " + p.spool_dir ().string () +
              " -f " + (p.tmp_dir () / path ("Prototype")).string ());

      assert (cs[1].render () ==
              "pkgtrans -s " + p.spool_dir ().string () + ' ' +
              p.artifact_path ().string () + " myproject");
    }

    // Build.
    //
    {
      dir_path scripts (td.dir / dir_path ("scripts"));
      touch (scripts / path ("postinst"), "echo done\n");
      prj.package_scripts_path = scripts;

      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_solaris p (prj, cfg, ex);
      p.build ();

      assert (exists (p.tmp_dir () / path ("postinstall")));
      assert (!exists (p.tmp_dir () / path ("preinstall")));
      assert (exists (p.spool_dir ()));

      text_document d;
      d.append (read_file (p.tmp_dir () / path ("Prototype")));
      const strings& ls (d.lines ());

      const string t (p.tmp_dir ().string ());

      assert (ls[0] == "i pkginfo=" + t + "/pkginfo");
      assert (ls[1] == "i postinstall=" + t + "/postinstall");

      // The staged tree is walked in the sorted order so the prototype is
      // deterministic.
      //
      const string inst (
        prj.install_dir.relative (prj.install_dir.root_directory ())
        .string ());

      // Only the installation directory and its contents are claimed, not
      // its parents.
      //
      const string id ("d none " + inst + ' ');
      assert (ls[2].compare (0, id.size (), id) == 0);

      for (size_t i (2); i != ls.size (); ++i)
        assert (ls[i].compare (7, inst.size (), inst) == 0);

      assert (find (ls.begin (), ls.end (),
                    "f none " + inst + "/share/doc/README 0644 root root") !=
              ls.end ());
      assert (find (ls.begin (), ls.end (),
                    "f none " + inst + "/bin/myproject 0644 root root") !=
              ls.end ());
      assert (ls.back () ==
              "f none " + inst + "/share/doc/README 0644 root root");

      assert (read_file (p.tmp_dir () / path ("pkginfo")) ==
              p.pkginfo ().render ());

      strings cs (rendered (sim));
      assert (cs.size () == 2);
      assert (cs[0].compare (0, 6, "pkgmk ") == 0);
      assert (cs[1].compare (0, 9, "pkgtrans ") == 0);

      prj.package_scripts_path = dir_path ();
    }

    return 0;
  }
}

int
main ()
{
  return mkinst::main ();
}
