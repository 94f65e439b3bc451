// file      : mkinst/packager.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PACKAGER_HXX
#define MKINST_PACKAGER_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/command.hxx>
#include <mkinst/project.hxx>
#include <mkinst/configuration.hxx>

namespace mkinst
{
  // Package formats.
  //
  enum class package_format
  {
    mac_pkg,
    mac_dmg,
    deb,
    rpm,
    msi,
    makeself,
    solaris
  };

  string
  to_string (package_format);

  // Throw invalid_argument if the format name is unknown.
  //
  package_format
  to_package_format (const string&);

  inline ostream&
  operator<< (ostream& os, package_format f)
  {
    return os << to_string (f);
  }

  // Produced artifact.
  //
  struct binary_file
  {
    string       type;   // Format name (e.g., deb).
    mkinst::path path;
    string       sha256; // Empty if the file was not produced (simulation).
  };

  using binary_files = vector<binary_file>;

  // The packager interface. One instance per (project, format) pair.
  //
  // The project, configuration, and executor are borrowed and must outlive
  // the packager. The packager only reads the project and configuration so
  // packagers for different formats can share them.
  //
  class packager
  {
  public:
    virtual
    ~packager () = default;

    package_format
    format () const {return format_;}

    // Temporary directory (<package_tmp>/<format>/), output directory
    // (<package_dir>/), and the staging directory under the temporary
    // directory.
    //
    const dir_path&
    tmp_dir () const {return tmp_dir_;}

    const dir_path&
    package_dir () const {return package_dir_;}

    virtual dir_path
    staging_dir () const;

    // Make sure the temporary and output directories exist and are writable
    // and clean the temporary directory. Throw path_resolution_error if any
    // of them is unusable.
    //
    void
    resolve_paths ();

    // Verify that the project provides everything this format requires.
    // Throw missing_required_configuration otherwise.
    //
    virtual void
    validate () const;

    // Return the final artifact file name. Only depends on the project and
    // configuration so can be called before any build step.
    //
    virtual string
    artifact_name () const = 0;

    path
    artifact_path () const {return package_dir_ / artifact_name ();}

    // Build the package: validate, resolve paths, stage, generate documents,
    // assemble, verify that the artifacts exist, and write the artifact
    // metadata files. Any failure aborts the remaining steps.
    //
    binary_files
    build ();

    // Whether to write the <artifact>.metadata.json files (true by
    // default).
    //
    void
    metadata (bool v) {metadata_ = v;}

  protected:
    packager (package_format,
              const project&,
              const configuration&,
              executor&);

    packager (const packager&) = delete;
    packager& operator= (const packager&) = delete;

    // Copy the files and write the documents into the temporary directory.
    //
    virtual void
    stage () = 0;

    virtual void
    generate () = 0;

    // Run the native tools and return the produced artifacts.
    //
    virtual paths
    assemble () = 0;

    // Called if any of the build steps fails before the exception is
    // propagated.
    //
    virtual void
    aborted () {}

    // Return the signing identity if signing is enabled and the identity is
    // configured and non-empty.
    //
    optional<string>
    signing_identity () const;

    // Target architecture as a target triplet.
    //
    target_triplet
    target () const;

    // Return the installation directory re-rooted under the specified
    // directory (e.g., <root>/opt/myproject/).
    //
    dir_path
    install_root (const dir_path& root) const;

    // Copy the installation directory contents into the installation
    // directory re-rooted under the specified directory.
    //
    void
    stage_install_dir (const dir_path& root) const;

    // Return the path of the project maintainer script (preinst, postinst,
    // prerm, or postrm) or nullopt if there is no such script.
    //
    optional<path>
    script (const string& name) const;

    // Copy the project maintainer script, if present, returning true if
    // copied.
    //
    bool
    copy_script (const string& name, const path& to) const;

    // Write <artifact>.metadata.json next to the artifact.
    //
    void
    write_metadata (const binary_file&) const;

    string
    run (const command_line& c) {return executor_.run (c);}

    package_format        format_;
    const project&        project_;
    const configuration&  config_;
    executor&             executor_;

    dir_path tmp_dir_;
    dir_path package_dir_;

    bool metadata_ = true;
  };

  // Strip all non-alphanumeric characters and lowercase the rest.
  //
  string
  safe_token (const string&);

  // Return the placeholder identifier derived from the project maintainer
  // and name: test.<maintainer>.pkg.<name>.
  //
  string
  fallback_identifier (const project&);

  // Create the packager for the specified format.
  //
  unique_ptr<packager>
  make_packager (package_format,
                 const project&,
                 const configuration&,
                 executor&);
}

#endif // MKINST_PACKAGER_HXX
