// file      : mkinst/packager-makeself.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-makeself.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  packager_makeself::
  packager_makeself (const project& p, const configuration& c, executor& e)
      : packager (package_format::makeself, p, c, e)
  {
  }

  string packager_makeself::
  artifact_name () const
  {
    return project_.name + '-' + project_.version + '-' +
           to_string (project_.iteration) + ".sh";
  }

  text_document packager_makeself::
  install_script () const
  {
    const string dir (
      quote_argument (single_line ("install-dir",
                                   project_.install_dir.string ())));

    text_document d;

    d.line ("#!/bin/sh")
     .line ("#")
     .line ("# Install " +
            single_line ("friendly-name", project_.friendly_name) + ' ' +
            project_.version + '-' + to_string (project_.iteration) +
            " into " + project_.install_dir.string () + '.')
     .line ("#")
     .line ()
     .line ("set -e")
     .line ()
     .line ("INSTALL_DIR=" + dir)
     .line ()
     .line ("mkdir -p \"$INSTALL_DIR\"")
     .line ("cp -R ./payload/. \"$INSTALL_DIR\"")
     .line ()
     .line ("if [ -f ./postinst ]; then")
     .line ("  INSTALL_DIR=\"$INSTALL_DIR\" sh ./postinst")
     .line ("fi")
     .line ()
     .line ("echo \"Installed into $INSTALL_DIR\"");

    return d;
  }

  command_line packager_makeself::
  build_command () const
  {
    command_line c ("makeself", tmp_dir_);

    c.flag ("--gzip")
     .argument (staging_dir ().string ())
     .argument (artifact_path ().string ())
     .argument (project_.friendly_name)
     .argument ("./makeselfinst");

    return c;
  }

  void packager_makeself::
  stage ()
  {
    // Note that the payload is the contents of the installation directory,
    // not the re-rooted tree.
    //
    const dir_path& d (project_.install_dir);

    if (!exists (d))
      fail << "installation directory " << d << " does not exist" <<
        info << "the project must be built before it can be packaged";

    cp_r (d, payload_dir ());

    copy_script ("postinst", staging_dir () / "postinst");
  }

  void packager_makeself::
  generate ()
  {
    write_document (install_script_path (),
                    install_script (),
                    script_permissions);
  }

  paths packager_makeself::
  assemble ()
  {
    run (build_command ());
    return paths {artifact_path ()};
  }
}
