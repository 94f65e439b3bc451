// file      : mkinst/packager-deb.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-deb.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  packager_deb::
  packager_deb (const project& p, const configuration& c, executor& e)
      : packager (package_format::deb, p, c, e)
  {
  }

  string packager_deb::
  package_name () const
  {
    if (project_.deb_identifier)
      return *project_.deb_identifier;

    string r;
    for (char c: project_.name)
    {
      c = lcase (c);
      r += (digit (c) || (c >= 'a' && c <= 'z') ||
            c == '.' || c == '+' || c == '-') ? c : '-';
    }
    return r;
  }

  string packager_deb::
  package_version () const
  {
    string r (project_.version);
    replace (r.begin (), r.end (), '-', '~');
    return r;
  }

  string packager_deb::
  architecture () const
  {
    const string& c (target ().cpu);

    if (c == "x86_64" || c == "amd64")
      return "amd64";

    if (c == "i386" || c == "i486" || c == "i586" || c == "i686")
      return "i386";

    if (c == "aarch64" || c == "arm64")
      return "arm64";

    if (c.compare (0, 3, "arm") == 0)
      return "armhf";

    return c;
  }

  string packager_deb::
  artifact_name () const
  {
    return package_name () + '_' + package_version () + '-' +
           to_string (project_.iteration) + '_' + architecture () + ".deb";
  }

  void packager_deb::
  validate () const
  {
    packager::validate ();

    // Maintainer must be in the `Name <email>` form.
    //
    const string& m (project_.maintainer);
    size_t b (m.find ('<'));
    size_t e (m.rfind ('>'));

    if (b == string::npos || b == 0 ||
        e == string::npos || e != m.size () - 1 ||
        e <= b + 1 ||
        m.find ('@', b) == string::npos ||
        m.find ('@', b) > e)
      throw missing_required_configuration ("maintainer",
                                            "'Joe Doe <joe@example.org>'");

    if (package_name ().empty ())
      throw missing_required_configuration ("deb-identifier", "'myproject'");
  }

  control_document packager_deb::
  control (uint64_t installed_size) const
  {
    control_document d;

    d.field ("Package", package_name ())
     .field ("Version",
             package_version () + '-' + to_string (project_.iteration))
     .field ("License", project_.license)
     .field ("Vendor",
             project_.vendor ? *project_.vendor : project_.maintainer)
     .field ("Architecture", architecture ())
     .field ("Maintainer", project_.maintainer)
     .field ("Installed-Size", to_string (installed_size))
     .field ("Section", "misc")
     .field ("Priority", "extra");

    if (project_.homepage)
      d.field ("Homepage", *project_.homepage);

    // The first line is the synopsis and the rest is the extended
    // description.
    //
    string desc (project_.friendly_name);
    if (project_.description && !project_.description->empty ())
    {
      desc += '\n';
      desc += *project_.description;
    }

    d.field ("Description", move (desc), true /* multiline */);
    return d;
  }

  command_line packager_deb::
  build_command () const
  {
    command_line c ("fakeroot", tmp_dir_);

    c.argument ("dpkg-deb")
     .flag ("-z9")
     .flag ("-Zgzip")
     .flag ("-D")
     .option ("--build", staging_dir ().string ())
     .argument (artifact_path ().string ());

    return c;
  }

  void packager_deb::
  stage ()
  {
    stage_install_dir (staging_dir ());

    mk_p (control_dir ());

    // dpkg-deb requires the maintainer scripts to be executable and not
    // writable by group and others.
    //
    for (const char* s: {"preinst", "postinst", "prerm", "postrm"})
    {
      path f (control_dir () / s);

      if (copy_script (s, f))
      {
        try
        {
          path_permissions (f,
                            permissions::ru | permissions::wu | permissions::xu |
                            permissions::rg | permissions::xg |
                            permissions::ro | permissions::xo);
        }
        catch (const system_error& e)
        {
          fail << "unable to set permissions on " << f << ": " << e;
        }
      }
    }
  }

  void packager_deb::
  generate ()
  {
    // Installed size in KiB, rounded up.
    //
    uint64_t size (0);
    for (const tree_entry& e: scan_tree (install_root (staging_dir ())))
      size += e.size;

    write_document (control_dir () / "control",
                    control ((size + 1023) / 1024));
  }

  paths packager_deb::
  assemble ()
  {
    run (build_command ());
    return paths {artifact_path ()};
  }
}
