// file      : mkinst/packager-rpm.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_RPM_HXX
#define MKINST_PACKAGER_RPM_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The RPM binary package (.rpm) packager. The package is built with
  // rpmbuild from the generated spec file using the private top directory:
  //
  // <tmp>/SPECS/<package>.spec
  // <tmp>/BUILD/<install_dir>/...  (build root)
  // <tmp>/RPMS/<arch>/<artifact>
  //
  class packager_rpm: public packager
  {
  public:
    packager_rpm (const project&, const configuration&, executor&);

    // <package>-<version>-<iteration>.<arch>.rpm
    //
    virtual string
    artifact_name () const override;

    // The rpm-identifier or the project name with characters other than
    // [A-Za-z0-9._+-] replaced with `-`.
    //
    string
    package_name () const;

    // The project version with `-` replaced with `_` (the version may not
    // contain `-` since it separates the release).
    //
    string
    package_version () const;

    // RPM architecture (x86_64, i686, aarch64, etc).
    //
    string
    architecture () const;

    virtual dir_path
    staging_dir () const override {return tmp_dir_ / dir_path ("BUILD");}

    path
    spec_path () const
    {
      return tmp_dir_ / dir_path ("SPECS") / path (package_name () + ".spec");
    }

    // Where rpmbuild places the package.
    //
    path
    rpms_path () const
    {
      return tmp_dir_ / dir_path ("RPMS") / dir_path (architecture ()) /
             path (artifact_name ());
    }

    // The spec file for the staged tree.
    //
    text_document
    spec () const;

    command_line
    build_command () const;

    // rpmsign command or nullopt if signing is disabled.
    //
    optional<command_line>
    sign_command () const;

  protected:
    virtual void
    stage () override;

    virtual void
    generate () override;

    virtual paths
    assemble () override;
  };
}

#endif // MKINST_PACKAGER_RPM_HXX
