// file      : mkinst/packager-mac-pkg.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-mac-pkg.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  packager_mac_pkg::
  packager_mac_pkg (const project& p, const configuration& c, executor& e)
      : packager (package_format::mac_pkg, p, c, e)
  {
  }

  string packager_mac_pkg::
  artifact_name () const
  {
    return project_.name + '-' + project_.version + '-' +
           to_string (project_.iteration) + ".pkg";
  }

  string packager_mac_pkg::
  component_pkg () const
  {
    return project_.name + "-core.pkg";
  }

  string packager_mac_pkg::
  identifier () const
  {
    return project_.mac_pkg_identifier
      ? *project_.mac_pkg_identifier
      : fallback_identifier (project_);
  }

  void packager_mac_pkg::
  validate () const
  {
    try
    {
      packager::validate ();

      if (project_.friendly_name.empty ())
        throw missing_required_configuration ("friendly-name", "'My Project'");

      state_ = state::validated;
    }
    catch (const missing_required_configuration&)
    {
      state_ = state::failed;
      throw;
    }
  }

  template <typename F>
  void packager_mac_pkg::
  transition (state s, const F& f)
  {
    if (state_ == state::failed)
      throw logic_error ("mac_pkg packager is in failed state");

    try
    {
      f ();
      state_ = s;
    }
    catch (...)
    {
      state_ = state::failed;
      throw;
    }
  }

  command_line packager_mac_pkg::
  component_command () const
  {
    command_line c ("pkgbuild", tmp_dir_);

    c.option ("--identifier", identifier ())
     .option ("--version", project_.version);

    if (!project_.package_scripts_path.empty ())
      c.option ("--scripts", project_.package_scripts_path.string ());

    c.option ("--root", project_.install_dir.string ())
     .option ("--install-location", project_.install_dir.string ())
     .argument (component_pkg ());

    return c;
  }

  command_line packager_mac_pkg::
  product_command () const
  {
    command_line c ("productbuild", tmp_dir_);

    c.option ("--distribution", distribution_path ().string ())
     .option ("--resources", resources_dir ().string ());

    if (optional<string> id = signing_identity ())
      c.option ("--sign", move (*id));

    c.argument (artifact_path ().string ());
    return c;
  }

  xml_document packager_mac_pkg::
  distribution () const
  {
    const string id (identifier ());
    const dir_path res (resources_dir ());

    xml_node root (xml_node::element ("installer-gui-script"));
    root.attribute ("minSpecVersion", "1");

    root.add (xml_node::element ("title", project_.friendly_name));

    // Optional installer resources, only referenced if present.
    //
    if (exists (res / path ("background.png")))
      root.add (xml_node::element ("background")
                .attribute ("file", "background.png")
                .attribute ("alignment", "bottomleft")
                .attribute ("mime-type", "image/png"));

    auto resource = [&root, &res] (const char* n)
    {
      static const pair<const char*, const char*> types[] = {
        {"html", "text/html"},
        {"rtf",  "text/rtf"},
        {"txt",  "text/plain"}};

      for (const auto& t: types)
      {
        string f (string (n) + '.' + t.first);

        if (exists (res / path (f)))
        {
          root.add (xml_node::element (n)
                    .attribute ("file", f)
                    .attribute ("mime-type", t.second));
          break;
        }
      }
    };

    resource ("welcome");
    resource ("license");

    // The rest is what productbuild --synthesize would generate for a
    // single component.
    //
    root.add (xml_node::blank ());
    root.add (xml_node::comment ("Generated by productbuild - - synthesize"));
    root.add (xml_node::element ("pkg-ref").attribute ("id", id));
    root.add (xml_node::element ("options")
              .attribute ("customize", "never")
              .attribute ("require-scripts", "false"));

    root.add (xml_node::element ("choices-outline")
              .add (xml_node::element ("line")
                    .attribute ("choice", "default")
                    .add (xml_node::element ("line")
                          .attribute ("choice", id))));

    root.add (xml_node::element ("choice").attribute ("id", "default"));
    root.add (xml_node::element ("choice")
              .attribute ("id", id)
              .attribute ("visible", "false")
              .add (xml_node::element ("pkg-ref").attribute ("id", id)));

    root.add (xml_node::element ("pkg-ref", component_pkg ())
              .attribute ("id", id)
              .attribute ("version", project_.version)
              .attribute ("onConclusion", "none"));

    return xml_document (move (root),
                         {{"version", "1.0"}, {"standalone", "no"}});
  }

  void packager_mac_pkg::
  build_component_pkg ()
  {
    transition (state::component_built,
                [this] ()
                {
                  if (verb >= 1)
                    text << "building component package " << component_pkg ();

                  run (component_command ());
                });
  }

  void packager_mac_pkg::
  generate_distribution ()
  {
    transition (state::distribution_generated,
                [this] ()
                {
                  write_document (distribution_path (), distribution ());
                });
  }

  void packager_mac_pkg::
  build_product_pkg ()
  {
    if (state_ != state::distribution_generated)
      generate_distribution ();

    transition (state::product_built,
                [this] ()
                {
                  if (verb >= 1)
                    text << "building product package " << artifact_name ();

                  run (product_command ());
                });
  }

  void packager_mac_pkg::
  stage ()
  {
    if (!project_.files_path.empty ())
    {
      dir_path d (project_.files_path / dir_path ("mac_pkg/Resources"));

      if (exists (d))
        cp_r (d, resources_dir ());
    }
  }

  void packager_mac_pkg::
  generate ()
  {
    // The distribution document is generated after the component package is
    // built (see assemble()).
  }

  paths packager_mac_pkg::
  assemble ()
  {
    build_component_pkg ();
    generate_distribution ();
    build_product_pkg ();

    return paths {artifact_path ()};
  }
}
