// file      : mkinst/packager-solaris.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-solaris.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  // Maintainer script to Solaris installation script name mapping.
  //
  static const pair<const char*, const char*> scripts[] = {
    {"preinst",  "preinstall"},
    {"postinst", "postinstall"},
    {"prerm",    "preremove"},
    {"postrm",   "postremove"}};

  packager_solaris::
  packager_solaris (const project& p, const configuration& c, executor& e)
      : packager (package_format::solaris, p, c, e)
  {
  }

  string packager_solaris::
  package_name () const
  {
    if (project_.solaris_identifier)
      return *project_.solaris_identifier;

    string r (safe_token (project_.name));

    if (r.size () > 32)
      r.resize (32);

    return r;
  }

  string packager_solaris::
  architecture () const
  {
    const string& c (target ().cpu);

    if (c.compare (0, 5, "sparc") == 0)
      return "sparc";

    if (c == "x86_64" || c == "amd64" ||
        c == "i386" || c == "i486" || c == "i586" || c == "i686")
      return "i386";

    return c;
  }

  string packager_solaris::
  artifact_name () const
  {
    return package_name () + '-' + project_.version + '-' +
           to_string (project_.iteration) + '.' + architecture () +
           ".solaris";
  }

  void packager_solaris::
  validate () const
  {
    packager::validate ();

    if (package_name ().empty ())
      throw missing_required_configuration ("solaris-identifier",
                                            "'myproject'");
  }

  text_document packager_solaris::
  pkginfo () const
  {
    auto value = [] (const char* n, const string& v)
    {
      return string (n) + '=' + single_line (n, v);
    };

    const string& desc (
      project_.description && !project_.description->empty ()
      ? *project_.description
      : project_.friendly_name);

    text_document d;

    d.line ("CLASSES=none")
     .line ("TZ=PST")
     .line ("PATH=/sbin:/usr/sbin:/usr/bin:/usr/sadm/install/bin")
     .line ("BASEDIR=/")
     .line (value ("PKG", package_name ()))
     .line (value ("NAME", project_.friendly_name))
     .line (value ("ARCH", architecture ()))
     .line (value ("VERSION",
                   project_.version + '-' + to_string (project_.iteration)))
     .line ("CATEGORY=application")
     .line (value ("DESC", desc))
     .line (value ("VENDOR",
                   project_.vendor ? *project_.vendor : project_.maintainer))
     .line (value ("EMAIL", project_.maintainer));

    return d;
  }

  // Return the prototype path, making sure it is representable.
  //
  static const string&
  prototype_path (const string& p)
  {
    if (p.find_first_of (" \t\n=") != string::npos)
      throw invalid_argument ("unsupported character in path '" + p + "'");

    return p;
  }

  static string
  octal (permissions m)
  {
    uint16_t v (static_cast<uint16_t> (m) & 07777);

    string r;
    for (int s (9); s >= 0; s -= 3)
      r += static_cast<char> ('0' + ((v >> s) & 07));

    return r;
  }

  text_document packager_solaris::
  prototype () const
  {
    text_document d;

    d.line ("i pkginfo=" + prototype_path ((tmp_dir_ / "pkginfo").string ()));

    for (const auto& s: scripts)
    {
      path f (tmp_dir_ / s.second);

      if (exists (f))
        d.line (string ("i ") + s.second + '=' +
                prototype_path (f.string ()));
    }

    // Note that the paths are relative to BASEDIR (/). List the
    // installation directory and everything in it so that the package
    // doesn't claim its parent directories (e.g., /opt).
    //
    dir_path root (install_root (staging_dir ()));

    if (exists (root))
    {
      const dir_path& id (project_.install_dir);
      dir_path base (id.absolute () ? id.relative (id.root_directory ()) : id);

      d.line ("d none " + prototype_path (base.string ()) + ' ' +
              octal (path_permissions (root)) + " root root");

      for (const tree_entry& e: scan_tree (root))
      {
        string p (prototype_path ((base / e.path).string ()));

        switch (e.type)
        {
        case entry_type::directory:
          {
            d.line ("d none " + p + ' ' + octal (e.mode) + " root root");
            break;
          }
        case entry_type::symlink:
          {
            d.line ("s none " + p + '=' +
                    prototype_path (e.target.string ()));
            break;
          }
        default:
          {
            d.line ("f none " + p + ' ' + octal (e.mode) + " root root");
            break;
          }
        }
      }
    }

    return d;
  }

  vector<command_line> packager_solaris::
  commands () const
  {
    vector<command_line> r;

    r.push_back (
      command_line ("pkgmk", tmp_dir_)
      .flag ("-o")
      .option ("-r", staging_dir ().string ())
      .option ("-d", spool_dir ().string ())
      .option ("-f", (tmp_dir_ / "Prototype").string ()));

    r.push_back (
      command_line ("pkgtrans", tmp_dir_)
      .flag ("-s")
      .argument (spool_dir ().string ())
      .argument (artifact_path ().string ())
      .argument (package_name ()));

    return r;
  }

  void packager_solaris::
  stage ()
  {
    stage_install_dir (staging_dir ());

    for (const auto& s: scripts)
      copy_script (s.first, tmp_dir_ / s.second);

    mk_p (spool_dir ());
  }

  void packager_solaris::
  generate ()
  {
    write_document (tmp_dir_ / "pkginfo", pkginfo ());
    write_document (tmp_dir_ / "Prototype", prototype ());
  }

  paths packager_solaris::
  assemble ()
  {
    for (const command_line& c: commands ())
      run (c);

    return paths {artifact_path ()};
  }
}
