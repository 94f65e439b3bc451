// file      : mkinst/test-utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// Helpers shared by the *.test.cxx drivers.
//

#ifndef MKINST_TEST_UTILITY_HXX
#define MKINST_TEST_UTILITY_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/command.hxx>
#include <mkinst/project.hxx>
#include <mkinst/document.hxx>
#include <mkinst/configuration.hxx>

namespace mkinst
{
  // Unique temporary directory, removed recursively on destruction.
  //
  struct temp_dir
  {
    dir_path dir;
    auto_rmdir rm;

    temp_dir ()
        : dir (dir_path::temp_path ("mkinst-test")), rm (dir)
    {
      mk_p (dir);
    }
  };

  // Write the file creating the parent directories if necessary.
  //
  inline void
  touch (const path& f, const string& content = string ())
  {
    mk_p (f.directory ());
    write_file (f,
                content,
                permissions::ru | permissions::wu |
                permissions::rg | permissions::ro);
  }

  // The myproject project with the installed tree under the specified
  // directory:
  //
  // <root>/opt/myproject/bin/myproject
  // <root>/opt/myproject/share/doc/README
  //
  // Note that the returned project's install_dir points into this tree.
  //
  inline project
  test_project (const dir_path& root)
  {
    project p;
    p.name = "myproject";
    p.friendly_name = "Myproject";
    p.maintainer = "Joe Doe <joe@example.org>";
    p.version = "23.4.2";
    p.iteration = 4;
    p.install_dir = root / dir_path ("opt/myproject");

    touch (p.install_dir / dir_path ("bin") / path ("myproject"),
           "#!/bin/sh\necho myproject\n");
    touch (p.install_dir / dir_path ("share/doc") / path ("README"),
           "myproject\n");

    return p;
  }

  // Point the package directories into the specified directory.
  //
  inline void
  test_configuration (configuration& c, const dir_path& root)
  {
    c.package_dir (root / dir_path ("pkg"));
    c.package_tmp (root / dir_path ("pkg-tmp"));
    c.architecture ("x86_64-linux-gnu");
  }

  // Return the rendered command lines recorded by the simulation.
  //
  inline strings
  rendered (const executor::simulation& s)
  {
    strings r;
    for (const command_line& c: s.commands)
      r.push_back (c.render ());
    return r;
  }
}

#endif // MKINST_TEST_UTILITY_HXX
