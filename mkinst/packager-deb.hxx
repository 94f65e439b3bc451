// file      : mkinst/packager-deb.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_DEB_HXX
#define MKINST_PACKAGER_DEB_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The Debian binary package (.deb) packager. The package is assembled
  // directly with dpkg-deb from the staged tree:
  //
  // <tmp>/root/DEBIAN/{control,preinst,postinst,prerm,postrm}
  // <tmp>/root/<install_dir>/...
  //
  class packager_deb: public packager
  {
  public:
    packager_deb (const project&, const configuration&, executor&);

    // <package>_<version>-<iteration>_<arch>.deb
    //
    virtual string
    artifact_name () const override;

    // The deb-identifier or the project name lowercased with characters
    // other than [a-z0-9.+-] replaced with `-`.
    //
    string
    package_name () const;

    // The project version with `-` replaced with `~` (the upstream version
    // may not contain `-` since it separates the revision).
    //
    string
    package_version () const;

    // Debian architecture (amd64, i386, arm64, armhf, etc).
    //
    string
    architecture () const;

    virtual dir_path
    staging_dir () const override {return tmp_dir_ / dir_path ("root");}

    dir_path
    control_dir () const {return staging_dir () / dir_path ("DEBIAN");}

    // In addition to the common checks, verify that the maintainer is in the
    // `Name <email>` form.
    //
    virtual void
    validate () const override;

    // The control file for the staged tree with the specified installed
    // size (in KiB).
    //
    control_document
    control (uint64_t installed_size) const;

    command_line
    build_command () const;

  protected:
    virtual void
    stage () override;

    virtual void
    generate () override;

    virtual paths
    assemble () override;
  };
}

#endif // MKINST_PACKAGER_DEB_HXX
