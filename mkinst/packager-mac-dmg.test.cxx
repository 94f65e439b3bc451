// file      : mkinst/packager-mac-dmg.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-mac-dmg.hxx>

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
    prj.files_path = td.dir / dir_path ("files");
    touch (prj.files_path / dir_path ("mac_dmg/Resources") /
           path ("background.png"), "png");

    const dir_path pkg (td.dir / dir_path ("pkg"));
    const dir_path tmp (td.dir / dir_path ("pkg-tmp/mac_dmg"));

    // Validation requires the product package (unless simulating).
    //
    {
      executor ex;
      packager_mac_dmg p (prj, cfg, ex);

      assert (p.artifact_name () == "myproject-23.4.2-4.dmg");
      assert (p.product_pkg () == pkg / path ("myproject-23.4.2-4.pkg"));

      try
      {
        p.validate ();
        assert (false);
      }
      catch (const missing_required_configuration& e)
      {
        assert (e.key == "mac_pkg");
      }

      touch (p.product_pkg (), "pkg");
      p.validate ();
    }

    // Layout script.
    //
    {
      executor ex;
      packager_mac_dmg p (prj, cfg, ex);

      text_document ld (p.layout_script ());
      const strings& ls (ld.lines ());

      assert (ls.front () == "tell application \"Finder\"");
      assert (ls[1] == "  tell disk \"Myproject\"");
      assert (find (ls.begin (), ls.end (),
                    "    set the bounds of container window to "
                    "{100, 100, 750, 600}") != ls.end ());
      assert (find (ls.begin (), ls.end (),
                    "    set position of item \"myproject-23.4.2-4.pkg\" "
                    "of container window to {535, 50}") != ls.end ());
      assert (ls.back () == "end tell");

      cfg.dmg_window_bounds ("10, 10, 20, 20");
      assert (find (ls.begin (), ls.end (),
                    "    set the bounds of container window to "
                    "{100, 100, 750, 600}") != ls.end ()); // Rendered.
      assert (p.layout_script ().lines ()[6] ==
              "    set the bounds of container window to {10, 10, 20, 20}");

      cfg.dmg_window_bounds ("100, 100, 750, 600");

      prj.friendly_name = "My \"Project\"";
      assert (p.layout_script ().lines ()[1] ==
              "  tell disk \"My \\\"Project\\\"\"");
      prj.friendly_name = "Myproject";

      cfg.dmg_pkg_position ("1,\n2");
      try
      {
        p.validate ();
        assert (false);
      }
      catch (const invalid_argument&) {}

      cfg.dmg_pkg_position ("535, 50");
    }

    // Commands.
    //
    {
      executor ex;
      packager_mac_dmg p (prj, cfg, ex);

      strings cs;
      for (const command_line& c: p.commands ())
      {
        assert (c.cwd () && *c.cwd () == tmp);
        cs.push_back (c.render ());
      }

      const string w ((tmp / path ("writable.dmg")).string ());
      const string m ((tmp / dir_path ("mount")).string ());
      const string a ((pkg / path ("myproject-23.4.2-4.dmg")).string ());

      assert (cs.size () == 5);
      assert (cs[0] ==
              "hdiutil create -volname Myproject"
              " -srcfolder " + (tmp / dir_path ("contents")).string () +
              " -ov -format UDRW -fs HFS+ -fsargs \"-c c=64,a=16,e=16\" " + w);
      assert (cs[1] ==
              "hdiutil attach -readwrite -noverify -noautoopen"
              " -mountpoint " + m + ' ' + w);
      assert (cs[2] ==
              "osascript " + (tmp / path ("create_dmg.osascript")).string ());
      assert (cs[3] == "hdiutil detach " + m);
      assert (cs[4] ==
              "hdiutil convert " + w +
              " -ov -format UDZO -imagekey zlib-level=9 -o " + a);

      cfg.sign_pkg (true);
      cfg.signing_identity (optional<string> ("Developer ID Application"));

      vector<command_line> sc (p.commands ());
      assert (sc.size () == 6);
      assert (sc[5].render () ==
              "codesign --sign \"Developer ID Application\" " + a);

      cfg.sign_pkg (false);
    }

    // Build.
    //
    {
      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_mac_dmg p (prj, cfg, ex);
      binary_files bs (p.build ());

      assert (bs.size () == 1 && bs[0].type == "mac_dmg");
      assert (exists (p.contents_dir () / path ("myproject-23.4.2-4.pkg")));
      assert (read_file (p.contents_dir () / dir_path (".support") /
                         path ("background.png")) == "png");
      assert (exists (p.mount_dir ()));
      assert (read_file (p.script_path ()) ==
              p.layout_script ().render ());
      assert (read_file (p.script_path ()).find (
                "set background picture of theViewOptions to file "
                "\".support:background.png\"") != string::npos);
      assert (sim.commands.size () == 5);
    }

    // The image is detached if the layout script fails.
    //
    {
      executor ex;
      executor::simulation sim;
      sim.failures["osascript"] = make_pair (1, string ("execution error"));
      ex.simulate_ = &sim;

      packager_mac_dmg p (prj, cfg, ex);

      try
      {
        p.build ();
        assert (false);
      }
      catch (const external_tool_failure& e)
      {
        assert (e.program == "osascript");
      }

      strings cs (rendered (sim));
      assert (cs.size () == 4);
      assert (cs[3] == "hdiutil detach " + p.mount_dir ().string ());
    }

    // Without the background the layout script doesn't refer to it.
    //
    {
      rm (prj.files_path / dir_path ("mac_dmg/Resources") /
          path ("background.png"));

      executor ex;
      executor::simulation sim;
      ex.simulate_ = &sim;

      packager_mac_dmg p (prj, cfg, ex);
      p.build ();

      assert (!exists (p.background_path ()));

      string s (read_file (p.script_path ()));
      assert (s.find ("background picture") == string::npos);
      assert (s.find ("set icon size of theViewOptions to 72\n"
                      "    delay 5\n") != string::npos);
      assert (sim.commands.size () == 5);
    }

    return 0;
  }
}

int
main ()
{
  return mkinst::main ();
}
