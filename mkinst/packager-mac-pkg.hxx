// file      : mkinst/packager-mac-pkg.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_MAC_PKG_HXX
#define MKINST_PACKAGER_MAC_PKG_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/document.hxx>
#include <mkinst/packager.hxx>

namespace mkinst
{
  // The Mac OS product package (.pkg) packager.
  //
  // The product package is built in two steps: first the component package
  // containing the installation directory is built with pkgbuild and then
  // it is wrapped into the product package with productbuild using the
  // generated distribution document.
  //
  class packager_mac_pkg: public packager
  {
  public:
    enum class state
    {
      created,
      validated,
      component_built,
      distribution_generated,
      product_built,
      failed
    };

    packager_mac_pkg (const project&, const configuration&, executor&);

    state
    current_state () const {return state_;}

    // <name>-<version>-<iteration>.pkg
    //
    virtual string
    artifact_name () const override;

    // <name>-core.pkg
    //
    string
    component_pkg () const;

    // The bundle identifier: mac-pkg-identifier or the fallback identifier.
    //
    string
    identifier () const;

    path
    distribution_path () const {return tmp_dir_ / path ("Distribution");}

    dir_path
    resources_dir () const {return tmp_dir_ / dir_path ("Resources");}

    virtual dir_path
    staging_dir () const override {return resources_dir ();}

    virtual void
    validate () const override;

    // Build steps. On failure the packager moves to the failed state and
    // the exception is propagated.
    //
    void
    build_component_pkg ();

    void
    generate_distribution ();

    // Generate the distribution first if not yet generated.
    //
    void
    build_product_pkg ();

    command_line
    component_command () const;

    command_line
    product_command () const;

    xml_document
    distribution () const;

  protected:
    virtual void
    stage () override;

    virtual void
    generate () override;

    virtual paths
    assemble () override;

    virtual void
    aborted () override {state_ = state::failed;}

  private:
    template <typename F>
    void
    transition (state, const F&);

    mutable state state_ = state::created;
  };
}

#endif // MKINST_PACKAGER_MAC_PKG_HXX
