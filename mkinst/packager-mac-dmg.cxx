// file      : mkinst/packager-mac-dmg.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-mac-dmg.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  packager_mac_dmg::
  packager_mac_dmg (const project& p, const configuration& c, executor& e)
      : packager (package_format::mac_dmg, p, c, e)
  {
  }

  string packager_mac_dmg::
  artifact_name () const
  {
    return project_.name + '-' + project_.version + '-' +
           to_string (project_.iteration) + ".dmg";
  }

  path packager_mac_dmg::
  product_pkg () const
  {
    return package_dir_ / path (project_.name + '-' + project_.version + '-' +
                                to_string (project_.iteration) + ".pkg");
  }

  void packager_mac_dmg::
  validate () const
  {
    packager::validate ();

    if (project_.friendly_name.empty ())
      throw missing_required_configuration ("friendly-name", "'My Project'");

    // The window bounds and package position end up in the layout script.
    //
    single_line ("dmg_window_bounds", config_.dmg_window_bounds ());
    single_line ("dmg_pkg_position", config_.dmg_pkg_position ());

    if (!executor_.simulated () && !exists (product_pkg ()))
      throw missing_required_configuration (
        "mac_pkg", "'" + product_pkg ().string () + "' (build mac_pkg first)");
  }

  // Quote the string as an AppleScript string literal.
  //
  static string
  applescript_string (const string& s)
  {
    single_line ("AppleScript string", s);

    string r ("\"");
    for (char c: s)
    {
      if (c == '"' || c == '\\')
        r += '\\';

      r += c;
    }
    r += '"';

    return r;
  }

  text_document packager_mac_dmg::
  layout_script () const
  {
    text_document d;

    d.line ("tell application \"Finder\"")
     .line ("  tell disk " + applescript_string (project_.friendly_name))
     .line ("    open")
     .line ("    set current view of container window to icon view")
     .line ("    set toolbar visible of container window to false")
     .line ("    set statusbar visible of container window to false")
     .line ("    set the bounds of container window to {" +
            single_line ("dmg_window_bounds", config_.dmg_window_bounds ()) +
            "}")
     .line ("    set theViewOptions to the icon view options of container "
            "window")
     .line ("    set arrangement of theViewOptions to not arranged")
     .line ("    set icon size of theViewOptions to 72");

    if (exists (background_path ()))
      d.line ("    set background picture of theViewOptions to file "
              "\".support:background.png\"");

    d.line ("    delay 5")
     .line ("    set position of item " +
            applescript_string (product_pkg ().leaf ().string ()) +
            " of container window to {" +
            single_line ("dmg_pkg_position", config_.dmg_pkg_position ()) +
            "}")
     .line ("    update without registering applications")
     .line ("    delay 5")
     .line ("  end tell")
     .line ("end tell");

    return d;
  }

  vector<command_line> packager_mac_dmg::
  commands () const
  {
    vector<command_line> r;

    r.push_back (
      command_line ("hdiutil", tmp_dir_)
      .argument ("create")
      .option ("-volname", project_.friendly_name)
      .option ("-srcfolder", contents_dir ().string ())
      .flag ("-ov")
      .option ("-format", "UDRW")
      .option ("-fs", "HFS+")
      .option ("-fsargs", "-c c=64,a=16,e=16")
      .argument (writable_image ().string ()));

    r.push_back (
      command_line ("hdiutil", tmp_dir_)
      .argument ("attach")
      .flag ("-readwrite")
      .flag ("-noverify")
      .flag ("-noautoopen")
      .option ("-mountpoint", mount_dir ().string ())
      .argument (writable_image ().string ()));

    r.push_back (
      command_line ("osascript", tmp_dir_)
      .argument (script_path ().string ()));

    r.push_back (
      command_line ("hdiutil", tmp_dir_)
      .argument ("detach")
      .argument (mount_dir ().string ()));

    r.push_back (
      command_line ("hdiutil", tmp_dir_)
      .argument ("convert")
      .argument (writable_image ().string ())
      .flag ("-ov")
      .option ("-format", "UDZO")
      .option ("-imagekey", "zlib-level=9")
      .option ("-o", artifact_path ().string ()));

    if (optional<string> id = signing_identity ())
      r.push_back (
        command_line ("codesign", tmp_dir_)
        .option ("--sign", move (*id))
        .argument (artifact_path ().string ()));

    return r;
  }

  void packager_mac_dmg::
  stage ()
  {
    const path pkg (product_pkg ());

    if (exists (pkg))
      cp (pkg, contents_dir () / pkg.leaf ());

    if (!project_.files_path.empty ())
    {
      path bg (project_.files_path /
               dir_path ("mac_dmg/Resources") /
               path ("background.png"));

      if (exists (bg))
      {
        mk_p (background_path ().directory ());
        cp (bg, background_path ());
      }
    }

    mk_p (mount_dir ());
  }

  void packager_mac_dmg::
  generate ()
  {
    write_document (script_path (), layout_script ());
  }

  paths packager_mac_dmg::
  assemble ()
  {
    vector<command_line> cs (commands ());

    // If the layout script fails, detach the image so that it doesn't stay
    // mounted.
    //
    for (size_t i (0); i != cs.size (); ++i)
    {
      try
      {
        run (cs[i]);
      }
      catch (const external_tool_failure&)
      {
        if (i == 2) // osascript
        {
          try
          {
            run (cs[3]);
          }
          catch (const external_tool_failure& e)
          {
            warn << "unable to detach " << mount_dir () << ": " << e.what ();
          }
        }

        throw;
      }
    }

    return paths {artifact_path ()};
  }
}
