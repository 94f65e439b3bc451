// file      : mkinst/packager-msi.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager-msi.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  packager_msi::
  packager_msi (const project& p, const configuration& c, executor& e)
      : packager (package_format::msi, p, c, e)
  {
  }

  string packager_msi::
  artifact_name () const
  {
    return project_.name + '-' + project_.version + '-' +
           to_string (project_.iteration) + ".msi";
  }

  string packager_msi::
  msi_version () const
  {
    const string& v (project_.version);

    string r;
    size_t n (0);
    for (size_t i (0); i != v.size () && n != 3; )
    {
      if (!digit (v[i]))
        break;

      size_t b (i);
      for (; i != v.size () && digit (v[i]); ++i) ;

      if (n != 0)
        r += '.';

      r.append (v, b, i - b);
      ++n;

      // Continue only if the dot is followed by another component.
      //
      if (i + 1 < v.size () && v[i] == '.' && digit (v[i + 1]))
        ++i;
      else
        break;
    }

    if (n == 0)
      throw missing_required_configuration ("version", "'1.2.3'");

    return r + '.' + to_string (project_.iteration);
  }

  const string& packager_msi::
  upgrade_code () const
  {
    if (!project_.msi_identifier || project_.msi_identifier->empty ())
      throw missing_required_configuration (
        "msi-identifier", "'2CD7259C-776D-4DDB-A4C8-6E544E580AA1'");

    return *project_.msi_identifier;
  }

  void packager_msi::
  validate () const
  {
    packager::validate ();

    upgrade_code ();
    msi_version ();

    if (project_.friendly_name.empty ())
      throw missing_required_configuration ("friendly-name", "'My Project'");
  }

  // Return the last component of the (potentially Windows) directory path.
  //
  static string
  location_name (const dir_path& d)
  {
    const string& s (d.string ());

    size_t e (s.find_last_not_of ("/\\"));
    if (e == string::npos)
      return string ();

    size_t b (s.find_last_of ("/\\:", e));
    b = (b == string::npos ? 0 : b + 1);

    return string (s, b, e - b + 1);
  }

  // Preprocessor variable definition: <?define name="value" ?>.
  //
  static xml_node
  define (const char* n, const string& v)
  {
    if (v.find_first_of ("\"\n") != string::npos)
      throw invalid_argument (string ("invalid ") + n + " value '" + v + "'");

    return xml_node::instruction ("define", string (n) + "=\"" + v + '"');
  }

  xml_document packager_msi::
  parameters () const
  {
    xml_node root (xml_node::element ("Include"));

    root.add (define ("VersionNumber", msi_version ()))
        .add (define ("DisplayVersionNumber", project_.version))
        .add (define ("UpgradeCode", upgrade_code ()))
        .add (define ("InstallDir", project_.install_dir.string ()));

    return xml_document (move (root),
                         {{"version", "1.0"}, {"encoding", "utf-8"}},
                         2);
  }

  xml_document packager_msi::
  localization () const
  {
    auto str = [] (const char* id, const string& v)
    {
      return xml_node::element ("String", v).attribute ("Id", id);
    };

    const string& n (project_.friendly_name);

    xml_node root (xml_node::element ("WixLocalization"));
    root.attribute ("Culture", "en-us")
        .attribute ("Codepage", "1252")
        .attribute ("xmlns",
                    "http://schemas.microsoft.com/wix/2006/localization");

    root.add (str ("LANGID", "1033"))
        .add (str ("ProductName", n))
        .add (str ("ManufacturerName",
                   project_.vendor ? *project_.vendor : project_.maintainer))
        .add (str ("FeatureMainName", n))
        .add (str ("DowngradeErrorMessage",
                   "A newer version of " + n + " is already installed."));

    return xml_document (move (root),
                         {{"version", "1.0"}, {"encoding", "utf-8"}},
                         2);
  }

  xml_document packager_msi::
  source () const
  {
    xml_node product (xml_node::element ("Product"));
    product.attribute ("Id", "*")
           .attribute ("Name", "!(loc.ProductName)")
           .attribute ("Language", "!(loc.LANGID)")
           .attribute ("Version", "$(var.VersionNumber)")
           .attribute ("Manufacturer", "!(loc.ManufacturerName)")
           .attribute ("UpgradeCode", "$(var.UpgradeCode)");

    product.add (xml_node::element ("Package")
                 .attribute ("InstallerVersion", "200")
                 .attribute ("Compressed", "yes")
                 .attribute ("InstallScope", "perMachine"));

    product.add (xml_node::element ("MajorUpgrade")
                 .attribute ("DowngradeErrorMessage",
                             "!(loc.DowngradeErrorMessage)"));

    product.add (xml_node::element ("Media")
                 .attribute ("Id", "1")
                 .attribute ("Cabinet", "Project.cab")
                 .attribute ("EmbedCab", "yes")
                 .attribute ("CompressionLevel", "high"));

    product.add (
      xml_node::element ("Directory")
      .attribute ("Id", "TARGETDIR")
      .attribute ("Name", "SourceDir")
      .add (xml_node::element ("Directory")
            .attribute ("Id", "WINDOWSVOLUME")
            .add (xml_node::element ("Directory")
                  .attribute ("Id", "PROJECTLOCATION")
                  .attribute ("Name",
                              location_name (project_.install_dir)))));

    product.add (xml_node::element ("Feature")
                 .attribute ("Id", "ProjectFeature")
                 .attribute ("Title", "!(loc.FeatureMainName)")
                 .attribute ("Level", "1")
                 .attribute ("ConfigurableDirectory", "PROJECTLOCATION")
                 .add (xml_node::element ("ComponentGroupRef")
                       .attribute ("Id", "ProjectDir")));

    product.add (xml_node::element ("SetDirectory")
                 .attribute ("Id", "WINDOWSVOLUME")
                 .attribute ("Value", "[WindowsVolume]"));

    product.add (xml_node::element ("Property")
                 .attribute ("Id", "WIXUI_INSTALLDIR")
                 .attribute ("Value", "PROJECTLOCATION"));

    product.add (xml_node::element ("UIRef")
                 .attribute ("Id", "WixUI_InstallDir"));

    xml_node root (xml_node::element ("Wix"));
    root.attribute ("xmlns", "http://schemas.microsoft.com/wix/2006/wi")
        .add (xml_node::instruction ("include", "\"parameters.wxi\""))
        .add (move (product));

    return xml_document (move (root),
                         {{"version", "1.0"}, {"encoding", "utf-8"}},
                         2);
  }

  vector<command_line> packager_msi::
  commands () const
  {
    const string src (project_.install_dir.string ());

    vector<command_line> r;

    r.push_back (
      command_line ("heat.exe", tmp_dir_)
      .argument ("dir")
      .argument (src)
      .flag ("-nologo")
      .flag ("-srd")
      .flag ("-gg")
      .option ("-cg", "ProjectDir")
      .option ("-dr", "PROJECTLOCATION")
      .option ("-var", "var.ProjectSourceDir")
      .option ("-out", "project-files.wxs"));

    r.push_back (
      command_line ("candle.exe", tmp_dir_)
      .flag ("-nologo")
      .option ("-ext", "WixUtilExtension")
      .argument ("-dProjectSourceDir=" + src)
      .argument ("project-files.wxs")
      .argument ("source.wxs"));

    r.push_back (
      command_line ("light.exe", tmp_dir_)
      .flag ("-nologo")
      .option ("-ext", "WixUIExtension")
      .option ("-ext", "WixUtilExtension")
      .flag ("-cultures:en-us")
      .option ("-loc", "localization-en-us.wxl")
      .argument ("project-files.wixobj")
      .argument ("source.wixobj")
      .option ("-out", artifact_path ().string ()));

    if (optional<string> id = signing_identity ())
      r.push_back (
        command_line ("signtool.exe", tmp_dir_)
        .argument ("sign")
        .option ("/n", move (*id))
        .option ("/fd", "SHA256")
        .argument (artifact_path ().string ()));

    return r;
  }

  void packager_msi::
  stage ()
  {
    // The installation directory is harvested in place by heat.
  }

  void packager_msi::
  generate ()
  {
    write_document (tmp_dir_ / "parameters.wxi", parameters ());
    write_document (tmp_dir_ / "localization-en-us.wxl", localization ());
    write_document (tmp_dir_ / "source.wxs", source ());
  }

  paths packager_msi::
  assemble ()
  {
    for (const command_line& c: commands ())
      run (c);

    return paths {artifact_path ()};
  }
}
