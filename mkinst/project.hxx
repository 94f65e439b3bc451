// file      : mkinst/project.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_PROJECT_HXX
#define MKINST_PROJECT_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

namespace mkinst
{
  // Project metadata: read-only facts about the software product being
  // packaged.
  //
  struct project
  {
    string   name;
    string   friendly_name;
    string   maintainer;
    string   version;
    uint64_t iteration = 1;

    // The installation directory (e.g., /opt/myproject) which is also where
    // the staged install tree currently resides.
    //
    dir_path install_dir;

    // Packaging resources (files_path/<format>/...) and maintainer scripts
    // (preinst, postinst, etc). Either can be empty.
    //
    dir_path files_path;
    dir_path package_scripts_path;

    optional<string> homepage;
    optional<string> description;
    string           license = "Unspecified";
    optional<string> vendor;

    // Per-format identifier overrides.
    //
    optional<string> mac_pkg_identifier; // Bundle identifier.
    optional<string> deb_identifier;     // Package name.
    optional<string> rpm_identifier;     // Package name.
    optional<string> msi_identifier;     // Upgrade code.
    optional<string> solaris_identifier; // Package abbreviation.
  };

  // Load the project manifest. For example:
  //
  // : 1
  // name: myproject
  // friendly-name: My Project
  // maintainer: Joe Doe <joe@example.org>
  // version: 23.4.2
  // iteration: 4
  // install-dir: /opt/myproject
  // files-path: files
  // package-scripts-path: package-scripts
  //
  // Relative files-path and package-scripts-path are completed against the
  // manifest file directory.
  //
  // Issue diagnostics and fail on parsing errors. Throw
  // missing_required_configuration if one of name, version, maintainer, or
  // install-dir is absent.
  //
  project
  load_project (const path&);

  // As above but parse from a stream. The name is used in diagnostics and
  // as the base for relative paths.
  //
  project
  parse_project (istream&, const path& name);
}

#endif // MKINST_PROJECT_HXX
