// file      : mkinst/packager-mac-dmg.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_MAC_DMG_HXX
#define MKINST_PACKAGER_MAC_DMG_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The Mac OS disk image (.dmg) packager. Wraps the product package
  // previously built by the mac_pkg packager into a compressed disk image
  // with the customized Finder window layout.
  //
  class packager_mac_dmg: public packager
  {
  public:
    packager_mac_dmg (const project&, const configuration&, executor&);

    // <name>-<version>-<iteration>.dmg
    //
    virtual string
    artifact_name () const override;

    // The product package being wrapped (<package_dir>/<name>-<version>-
    // <iteration>.pkg).
    //
    path
    product_pkg () const;

    dir_path
    contents_dir () const {return tmp_dir_ / dir_path ("contents");}

    dir_path
    mount_dir () const {return tmp_dir_ / dir_path ("mount");}

    path
    writable_image () const {return tmp_dir_ / path ("writable.dmg");}

    // The window background, staged only if the project provides one.
    //
    path
    background_path () const
    {
      return contents_dir () / dir_path (".support") / path ("background.png");
    }

    path
    script_path () const {return tmp_dir_ / path ("create_dmg.osascript");}

    virtual dir_path
    staging_dir () const override {return contents_dir ();}

    // In addition to the common checks, verify that the product package
    // exists (unless simulating).
    //
    virtual void
    validate () const override;

    // The AppleScript that arranges the Finder window of the mounted image.
    // The background picture is only set if it is staged.
    //
    text_document
    layout_script () const;

    // The hdiutil create, attach, osascript, detach, convert, and optional
    // codesign commands, in the execution order.
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

#endif // MKINST_PACKAGER_MAC_DMG_HXX
