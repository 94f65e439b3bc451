// file      : mkinst/packager-rpm.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-rpm.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  packager_rpm::
  packager_rpm (const project& p, const configuration& c, executor& e)
      : packager (package_format::rpm, p, c, e)
  {
  }

  string packager_rpm::
  package_name () const
  {
    if (project_.rpm_identifier)
      return *project_.rpm_identifier;

    string r;
    for (char c: project_.name)
      r += (alnum (c) || c == '.' || c == '_' || c == '+' || c == '-')
        ? c
        : '-';
    return r;
  }

  string packager_rpm::
  package_version () const
  {
    string r (project_.version);
    replace (r.begin (), r.end (), '-', '_');
    return r;
  }

  string packager_rpm::
  architecture () const
  {
    const string& c (target ().cpu);

    if (c == "x86_64" || c == "amd64")
      return "x86_64";

    if (c == "i386" || c == "i486" || c == "i586" || c == "i686")
      return "i686";

    if (c == "aarch64" || c == "arm64")
      return "aarch64";

    return c;
  }

  string packager_rpm::
  artifact_name () const
  {
    return package_name () + '-' + package_version () + '-' +
           to_string (project_.iteration) + '.' + architecture () + ".rpm";
  }

  // Quote the path for the %files section.
  //
  static string
  files_entry (const path& p)
  {
    const string& s (p.string ());

    if (s.find_first_of ("\"\n") != string::npos)
      throw invalid_argument ("unsupported character in path '" + s + "'");

    string r ("\"");
    for (char c: s)
    {
      if (c == '%')
        r += '%';

      r += c;
    }
    r += '"';

    return r;
  }

  text_document packager_rpm::
  spec () const
  {
    text_document d;

    // Disable the build actions since we package an already built tree.
    //
    d.line ("%define __spec_prep_post true")
     .line ("%define __spec_prep_pre true")
     .line ("%define __spec_build_post true")
     .line ("%define __spec_build_pre true")
     .line ("%define __spec_install_post true")
     .line ("%define __spec_install_pre true")
     .line ("%define __spec_clean_post true")
     .line ("%define __spec_clean_pre true")
     .line ()
     .line ("%define _binary_payload w9.gzdio")
     .line ();

    d.line ("Name: " + single_line ("name", package_name ()))
     .line ("Version: " + single_line ("version", package_version ()))
     .line ("Release: " + to_string (project_.iteration))
     .line ("Summary: " + single_line ("friendly-name",
                                       project_.friendly_name))
     .line ("BuildArch: " + architecture ())
     .line ("AutoReqProv: no")
     .line ("BuildRoot: %buildroot")
     .line ("Prefix: /")
     .line ("Group: default")
     .line ("License: " + single_line ("license", project_.license))
     .line ("Vendor: " + single_line ("vendor",
                                      project_.vendor
                                      ? *project_.vendor
                                      : project_.maintainer))
     .line ("Packager: " + single_line ("maintainer", project_.maintainer));

    if (project_.homepage)
      d.line ("URL: " + single_line ("homepage", *project_.homepage));

    d.line ()
     .line ("%description");

    if (project_.description && !project_.description->empty ())
      d.append (*project_.description);
    else
      d.line (project_.friendly_name);

    for (const char* s: {"%prep", "%build", "%install", "%clean"})
    {
      d.line ()
       .line (s)
       .line ("# noop");
    }

    // Scriptlets.
    //
    static const pair<const char*, const char*> scriptlets[] = {
      {"preinst",  "%pre"},
      {"postinst", "%post"},
      {"prerm",    "%preun"},
      {"postrm",   "%postun"}};

    for (const auto& s: scriptlets)
    {
      if (optional<path> f = script (s.first))
      {
        d.line ()
         .line (s.second)
         .append (read_file (*f));
      }
    }

    // Files. List the installation directory and everything in it so that
    // the package doesn't own the parent directories (e.g., /opt).
    //
    d.line ()
     .line ("%files")
     .line ("%defattr(-,root,root,-)")
     .line ("%dir " + files_entry (path (project_.install_dir.string ())));

    dir_path root (install_root (staging_dir ()));
    if (exists (root))
    {
      for (const tree_entry& e: scan_tree (root))
      {
        path p (project_.install_dir / e.path);

        d.line (e.type == entry_type::directory
                ? "%dir " + files_entry (p)
                : files_entry (p));
      }
    }

    return d;
  }

  command_line packager_rpm::
  build_command () const
  {
    command_line c ("rpmbuild", tmp_dir_);

    c.option ("--target", architecture ())
     .flag ("-bb")
     .option ("--buildroot", staging_dir ().string ())
     .option ("--define", "_topdir " + tmp_dir_.string ())
     .argument (spec_path ().string ());

    return c;
  }

  optional<command_line> packager_rpm::
  sign_command () const
  {
    optional<string> id (signing_identity ());

    if (!id)
      return nullopt;

    command_line c ("rpmsign");
    c.flag ("--addsign")
     .option ("--define", "_gpg_name " + *id)
     .argument (artifact_path ().string ());

    return c;
  }

  void packager_rpm::
  stage ()
  {
    stage_install_dir (staging_dir ());

    mk_p (spec_path ().directory ());
    mk_p (rpms_path ().directory ());
  }

  void packager_rpm::
  generate ()
  {
    write_document (spec_path (), spec ());
  }

  paths packager_rpm::
  assemble ()
  {
    run (build_command ());

    path f (rpms_path ());
    if (!executor_.simulated () || exists (f))
      mv (f, artifact_path ());

    if (optional<command_line> c = sign_command ())
      run (*c);

    return paths {artifact_path ()};
  }
}
