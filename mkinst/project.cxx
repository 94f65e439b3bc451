// file      : mkinst/project.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/project.hxx>

#include <map>

#include <libbutl/manifest-parser.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  project
  parse_project (istream& is, const path& f)
  {
    project r;

    // Track which values have been seen to detect duplicates.
    //
    std::map<string, bool> seen;

    auto bad = [&f] (const manifest_name_value& nv,
                     bool value,
                     const string& d)
    {
      fail << f << ':'
           << (value ? nv.value_line : nv.name_line) << ':'
           << (value ? nv.value_column : nv.name_column) << ": " << d;
    };

    try
    {
      manifest_parser p (is, f.string ());
      manifest_name_value nv (p.next ());

      if (!nv.name.empty ())
        bad (nv, false, "start of project manifest expected");

      if (nv.value != "1")
        bad (nv, true, "unsupported format version");

      // Relative directories are completed against the manifest directory.
      //
      dir_path base (f.directory ());

      auto dir = [&base, &bad] (const manifest_name_value& nv,
                                bool absolute) -> dir_path
      {
        try
        {
          dir_path d (nv.value);

          if (d.empty ())
            bad (nv, true, "empty " + nv.name);

          if (d.relative ())
          {
            if (absolute)
              bad (nv, true, nv.name + " must be absolute");

            d = base / d;
          }

          d.normalize ();
          return d;
        }
        catch (const invalid_path& e)
        {
          bad (nv, true, "invalid " + nv.name + " '" + e.path + "'");
        }

        return dir_path (); // Unreachable.
      };

      for (nv = p.next (); !nv.empty (); nv = p.next ())
      {
        const string& n (nv.name);
        string& v (nv.value);

        if (!seen.emplace (n, true).second)
          bad (nv, false, n + " redefinition");

        if (v.empty () && n != "description")
          bad (nv, true, "empty " + n);

        if      (n == "name")          r.name = move (v);
        else if (n == "friendly-name") r.friendly_name = move (v);
        else if (n == "maintainer")    r.maintainer = move (v);
        else if (n == "version")       r.version = move (v);
        else if (n == "iteration")
        {
          if (find_if (v.begin (), v.end (),
                       [] (char c) {return !digit (c);}) != v.end ())
            bad (nv, true, "invalid iteration '" + v + "'");

          try
          {
            r.iteration = stoull (v);
          }
          catch (const out_of_range&)
          {
            bad (nv, true, "out of range iteration '" + v + "'");
          }
        }
        else if (n == "install-dir")          r.install_dir = dir (nv, true);
        else if (n == "files-path")           r.files_path = dir (nv, false);
        else if (n == "package-scripts-path")
          r.package_scripts_path = dir (nv, false);
        else if (n == "homepage")             r.homepage = move (v);
        else if (n == "description")          r.description = move (v);
        else if (n == "license")              r.license = move (v);
        else if (n == "vendor")               r.vendor = move (v);
        else if (n == "mac-pkg-identifier")   r.mac_pkg_identifier = move (v);
        else if (n == "deb-identifier")       r.deb_identifier = move (v);
        else if (n == "rpm-identifier")       r.rpm_identifier = move (v);
        else if (n == "msi-identifier")       r.msi_identifier = move (v);
        else if (n == "solaris-identifier")   r.solaris_identifier = move (v);
        else
          bad (nv, false, "unknown name '" + n + "' in project manifest");
      }

      nv = p.next ();
      if (!nv.empty ())
        bad (nv, false, "single project manifest expected");
    }
    catch (const manifest_parsing& e)
    {
      fail << e.name << ':' << e.line << ':' << e.column << ": "
           << e.description;
    }

    if (r.name.empty ())
      throw missing_required_configuration ("name", "'myproject'");

    if (r.version.empty ())
      throw missing_required_configuration ("version", "'1.2.3'");

    if (r.maintainer.empty ())
      throw missing_required_configuration ("maintainer",
                                            "'Joe Doe <joe@example.org>'");

    if (r.install_dir.empty ())
      throw missing_required_configuration ("install-dir", "'/opt/myproject'");

    if (r.friendly_name.empty ())
      r.friendly_name = r.name;

    return r;
  }

  project
  load_project (const path& f)
  {
    if (verb >= 3)
      text << "loading project from " << f;

    try
    {
      ifdstream ifs (f);
      project r (parse_project (ifs, f));
      ifs.close ();
      return r;
    }
    catch (const io_error& e)
    {
      fail << "unable to read from " << f << ": " << e << endf;
    }
  }
}
