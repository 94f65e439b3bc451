// file      : mkinst/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/utility.hxx>

#include <libbutl/fdstream.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  const target_triplet host_triplet (MKINST_HOST_TRIPLET);

  dir_path
  normalize (const dir_path& d, const char* what)
  {
    try
    {
      dir_path r (d);
      r.complete ().normalize ();
      return r;
    }
    catch (const invalid_path& e)
    {
      throw path_resolution_error (d,
                                   string ("invalid ") + what +
                                   " directory '" + e.path + "'");
    }
    catch (const system_error& e)
    {
      throw path_resolution_error (
        d, string ("unable to obtain current directory: ") + e.what ());
    }
  }

  dir_path
  current_directory ()
  {
    try
    {
      return dir_path::current_directory ();
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e << endf;
    }
  }

  bool
  exists (const path& f)
  {
    try
    {
      return file_exists (f);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d)
  {
    try
    {
      return dir_exists (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat " << d << ": " << e << endf;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    l3 ([&]{text << "mkdir -p " << d;});

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  rm (const path& f)
  {
    l3 ([&]{text << "rm " << f;});

    try
    {
      try_rmfile (f, true /* ignore_error */);
    }
    catch (const system_error& e)
    {
      fail << "unable to remove " << f << ": " << e;
    }
  }

  void
  mv (const path& from, const path& to)
  {
    l3 ([&]{text << "mv " << from << ' ' << to;});

    try
    {
      mvfile (from, to,
              cpflags::overwrite_content | cpflags::overwrite_permissions);
    }
    catch (const system_error& e)
    {
      fail << "unable to move " << from << " to " << to << ": " << e;
    }
  }

  void
  cp (const path& from, const path& to)
  {
    l3 ([&]{text << "cp " << from << ' ' << to;});

    try
    {
      cpfile (from, to,
              cpflags::overwrite_content | cpflags::overwrite_permissions);
    }
    catch (const system_error& e)
    {
      fail << "unable to copy file " << from << " to " << to << ": " << e;
    }
  }

  void
  cp_r (const dir_path& from, const dir_path& to)
  {
    l3 ([&]{text << "cp -r " << from << ' ' << to;});

    // Note that we don't go through mk_p() and cp() to keep the diagnostics
    // at the top level.
    //
    auto copy = [] (const dir_path& from,
                    const dir_path& to,
                    const auto& copy) -> void
    {
      try_mkdir_p (to);

      for (const dir_entry& de: dir_iterator (from, dir_iterator::no_follow))
      {
        const path& n (de.path ());

        switch (de.ltype ())
        {
        case entry_type::directory:
          {
            copy (path_cast<dir_path> (from / n),
                  path_cast<dir_path> (to / n),
                  copy);
            break;
          }
        case entry_type::symlink:
          {
            path l (to / n);

            if (file_exists (l, false /* follow_symlinks */))
              try_rmfile (l);

            mksymlink (readsymlink (from / n), l);
            break;
          }
        default:
          {
            cpfile (from / n, to / n,
                    cpflags::overwrite_content |
                    cpflags::overwrite_permissions);
            break;
          }
        }
      }
    };

    try
    {
      copy (from, to, copy);
    }
    catch (const system_error& e)
    {
      fail << "unable to copy directory " << from << " to " << to << ": "
           << e;
    }
  }

  vector<tree_entry>
  scan_tree (const dir_path& root)
  {
    vector<tree_entry> r;

    auto scan = [&root, &r] (const dir_path& rel, const auto& scan) -> void
    {
      dir_path d (root / rel);

      for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
      {
        path p (rel / de.path ());
        path f (root / p);

        tree_entry e {p, de.ltype (), permissions::none, 0, path ()};

        switch (e.type)
        {
        case entry_type::directory:
          {
            e.mode = path_permissions (f);
            r.push_back (move (e));
            scan (path_cast<dir_path> (p), scan);
            break;
          }
        case entry_type::symlink:
          {
            e.target = readsymlink (f);
            r.push_back (move (e));
            break;
          }
        default:
          {
            e.mode = path_permissions (f);
            e.size = path_entry (f, false /* follow_symlinks */).second.size;
            r.push_back (move (e));
            break;
          }
        }
      }
    };

    try
    {
      scan (dir_path (), scan);
    }
    catch (const system_error& e)
    {
      fail << "unable to scan directory " << root << ": " << e;
    }

    sort (r.begin (), r.end (),
          [] (const tree_entry& x, const tree_entry& y)
          {
            return x.path.string () < y.path.string ();
          });

    return r;
  }

  string
  sha256_file (const path& f)
  {
    try
    {
      ifdstream is (f, fdopen_mode::in | fdopen_mode::binary, ifdstream::badbit);

      sha256 cs;
      char buf[8192];

      while (!is.eof ())
      {
        is.read (buf, sizeof (buf));

        if (is.gcount () > 0)
          cs.append (buf, static_cast<size_t> (is.gcount ()));
      }

      is.close ();
      return cs.string ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e << endf;
    }
  }
}
