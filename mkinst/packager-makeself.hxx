// file      : mkinst/packager-makeself.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_MAKESELF_HXX
#define MKINST_PACKAGER_MAKESELF_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The self-extracting shell archive (.sh) packager. The archive is
  // created with makeself from the staging directory:
  //
  // <tmp>/staging/payload/...     (installation directory contents)
  // <tmp>/staging/postinst        (if the project has one)
  // <tmp>/staging/makeselfinst    (generated install script)
  //
  class packager_makeself: public packager
  {
  public:
    packager_makeself (const project&, const configuration&, executor&);

    // <name>-<version>-<iteration>.sh
    //
    virtual string
    artifact_name () const override;

    dir_path
    payload_dir () const {return staging_dir () / dir_path ("payload");}

    path
    install_script_path () const
    {
      return staging_dir () / path ("makeselfinst");
    }

    // The script makeself runs after extracting the archive.
    //
    text_document
    install_script () const;

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

#endif // MKINST_PACKAGER_MAKESELF_HXX
