// file      : mkinst/packager-solaris.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_SOLARIS_HXX
#define MKINST_PACKAGER_SOLARIS_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The Solaris SVR4 package packager. The package is created with pkgmk
  // into the spool directory and then translated into the datastream
  // format with pkgtrans:
  //
  // <tmp>/pkginfo
  // <tmp>/Prototype
  // <tmp>/{preinstall,postinstall,preremove,postremove}
  // <tmp>/root/<install_dir>/...
  // <tmp>/spool/<package>/...
  //
  class packager_solaris: public packager
  {
  public:
    packager_solaris (const project&, const configuration&, executor&);

    // <package>-<version>-<iteration>.<arch>.solaris
    //
    virtual string
    artifact_name () const override;

    // The solaris-identifier or the project name with all non-alphanumeric
    // characters stripped, lowercased, and truncated to 32 characters.
    //
    string
    package_name () const;

    // Solaris architecture (i386 or sparc).
    //
    string
    architecture () const;

    virtual dir_path
    staging_dir () const override {return tmp_dir_ / dir_path ("root");}

    dir_path
    spool_dir () const {return tmp_dir_ / dir_path ("spool");}

    virtual void
    validate () const override;

    text_document
    pkginfo () const;

    // The prototype for the staged tree (sorted) plus the information files
    // and the installation scripts present in the temporary directory.
    //
    text_document
    prototype () const;

    // The pkgmk and pkgtrans commands, in the execution order.
    //
    vector<command_line>
    commands () const;

  protected:
    virtual void
    stage () override;

    virtual void
    generate () override;

    virtual paths
    assemble () override;
  };
}

#endif // MKINST_PACKAGER_SOLARIS_HXX
