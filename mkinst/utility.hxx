// file      : mkinst/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_UTILITY_HXX
#define MKINST_UTILITY_HXX

#include <string>    // to_string()
#include <cstring>   // strchr()
#include <utility>   // move(), make_pair()
#include <algorithm> // find(), find_if_not(), sort()

#include <libbutl/utility.hxx>         // alnum(), lcase(), trim(), etc
#include <libbutl/filesystem.hxx>

#include <mkinst/types.hxx>

namespace mkinst
{
  using std::move;
  using std::make_pair;
  using std::to_string;

  using std::strchr;

  using butl::alpha;
  using butl::alnum;
  using butl::digit;

  using butl::lcase;
  using butl::trim;

  using butl::auto_rmdir;

  // Host target triplet for which we were built.
  //
  extern const target_triplet host_triplet;

  // Complete and normalize the packaging base directory (package_dir,
  // package_tmp, etc). Throw path_resolution_error if the path is invalid
  // or the current directory cannot be obtained.
  //
  dir_path
  normalize (const dir_path&, const char* what);

  dir_path
  current_directory ();

  // Filesystem. The file system errors are diagnosed and result in the
  // failed exception.
  //
  bool
  exists (const path&);

  bool
  exists (const dir_path&);

  void
  mk_p (const dir_path&);

  void
  rm (const path&);

  // Move the file replacing the destination, if exists. Used to collect the
  // package from where the native tool leaves it.
  //
  void
  mv (const path& from, const path& to);

  // Copy a file overwriting the destination, if exists, and preserving the
  // permissions.
  //
  void
  cp (const path& from, const path& to);

  // Copy the directory contents recursively, creating the destination
  // directory if it doesn't exist. Symlinks are copied as symlinks.
  //
  void
  cp_r (const dir_path& from, const dir_path& to);

  // Return the list of filesystem entries (files, directories, and
  // symlinks) in the specified directory and its subdirectories relative to
  // it and sorted lexicographically (so that the parent directory always
  // precedes its contents).
  //
  struct tree_entry
  {
    mkinst::path     path;   // Relative, without trailing slash.
    butl::entry_type type;
    permissions      mode;   // Unspecified for symlinks.
    uint64_t         size;   // Zero for directories and symlinks.
    mkinst::path     target; // Symlink target or empty.
  };

  vector<tree_entry>
  scan_tree (const dir_path&);

  // Calculate the SHA256 checksum of the file contents.
  //
  string
  sha256_file (const path&);
}

#endif // MKINST_UTILITY_HXX
