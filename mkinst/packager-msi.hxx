// file      : mkinst/packager-msi.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_MSI_HXX
#define MKINST_PACKAGER_MSI_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The Windows installer (.msi) packager. The installation directory is
  // harvested with heat and the installer is compiled and linked with the
  // WiX toolset from the generated sources:
  //
  // <tmp>/parameters.wxi
  // <tmp>/localization-en-us.wxl
  // <tmp>/source.wxs
  //
  class packager_msi: public packager
  {
  public:
    packager_msi (const project&, const configuration&, executor&);

    // <name>-<version>-<iteration>.msi
    //
    virtual string
    artifact_name () const override;

    // The numeric prefix of the project version (at most three components)
    // followed by the iteration (e.g., 1.2.3-rc1 with iteration 4 gives
    // 1.2.3.4).
    //
    string
    msi_version () const;

    // The upgrade code (msi-identifier). There is no safe fallback since it
    // must stay the same across all the versions of the product.
    //
    const string&
    upgrade_code () const;

    virtual void
    validate () const override;

    xml_document
    parameters () const;

    xml_document
    localization () const;

    xml_document
    source () const;

    // The heat, candle, light, and optional signtool commands, in the
    // execution order.
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

#endif // MKINST_PACKAGER_MSI_HXX
