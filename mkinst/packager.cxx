// file      : mkinst/packager.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/packager.hxx>

#include <libbutl/json/serializer.hxx>

#include <mkinst/document.hxx>
#include <mkinst/diagnostics.hxx>

#include <mkinst/packager-deb.hxx>
#include <mkinst/packager-msi.hxx>
#include <mkinst/packager-rpm.hxx>
#include <mkinst/packager-mac-dmg.hxx>
#include <mkinst/packager-mac-pkg.hxx>
#include <mkinst/packager-solaris.hxx>
#include <mkinst/packager-makeself.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  string
  to_string (package_format f)
  {
    switch (f)
    {
    case package_format::mac_pkg:  return "mac_pkg";
    case package_format::mac_dmg:  return "mac_dmg";
    case package_format::deb:      return "deb";
    case package_format::rpm:      return "rpm";
    case package_format::msi:      return "msi";
    case package_format::makeself: return "makeself";
    case package_format::solaris:  return "solaris";
    }

    return string (); // Should never reach.
  }

  package_format
  to_package_format (const string& s)
  {
         if (s == "mac_pkg")  return package_format::mac_pkg;
    else if (s == "mac_dmg")  return package_format::mac_dmg;
    else if (s == "deb")      return package_format::deb;
    else if (s == "rpm")      return package_format::rpm;
    else if (s == "msi")      return package_format::msi;
    else if (s == "makeself") return package_format::makeself;
    else if (s == "solaris")  return package_format::solaris;
    else throw invalid_argument ("unknown package format '" + s + "'");
  }

  string
  safe_token (const string& s)
  {
    string r;
    for (char c: s)
    {
      if (alnum (c))
        r += lcase (c);
    }
    return r;
  }

  string
  fallback_identifier (const project& p)
  {
    return "test." + safe_token (p.maintainer) + ".pkg." + safe_token (p.name);
  }

  // packager
  //
  packager::
  packager (package_format f,
            const project& p,
            const configuration& c,
            executor& e)
      : format_ (f), project_ (p), config_ (c), executor_ (e)
  {
    package_dir_ = normalize (c.package_dir (), "package");
    tmp_dir_ = normalize (c.package_tmp (), "package temporary") /
               dir_path (to_string (f));
  }

  dir_path packager::
  staging_dir () const
  {
    return tmp_dir_ / dir_path ("staging");
  }

  // Make sure the directory exists (creating it if necessary) and is
  // writable.
  //
  static void
  usable_directory (const dir_path& d)
  {
    try
    {
      pair<bool, entry_stat> pe (path_entry (d, true /* follow_symlinks */));

      if (pe.first && pe.second.type != entry_type::directory)
        throw path_resolution_error (d, "exists and is not a directory");

      try_mkdir_p (d);

      path p (d / ".mkinst-probe");
      {
        auto_fd fd (fdopen (p,
                            fdopen_mode::out    |
                            fdopen_mode::create |
                            fdopen_mode::truncate));
      }
      try_rmfile (p);
    }
    catch (const io_error& e)
    {
      throw path_resolution_error (d, e.what ());
    }
    catch (const system_error& e)
    {
      throw path_resolution_error (d, e.what ());
    }
  }

  void packager::
  resolve_paths ()
  {
    tracer trace ("packager::resolve_paths");

    usable_directory (package_dir_);
    usable_directory (tmp_dir_.directory ());

    // Start from the clean temporary directory so that stale files from the
    // previous runs don't end up in the package.
    //
    l4 ([&]{trace << "cleaning " << tmp_dir_;});

    try
    {
      if (dir_exists (tmp_dir_))
        rmdir_r (tmp_dir_, true /* dir */);
    }
    catch (const system_error& e)
    {
      throw path_resolution_error (tmp_dir_, e.what ());
    }

    usable_directory (tmp_dir_);
    usable_directory (staging_dir ());
  }

  void packager::
  validate () const
  {
    if (project_.name.empty ())
      throw missing_required_configuration ("name", "'myproject'");

    if (project_.version.empty ())
      throw missing_required_configuration ("version", "'1.2.3'");

    if (project_.install_dir.empty ())
      throw missing_required_configuration ("install-dir", "'/opt/myproject'");
  }

  binary_files packager::
  build ()
  {
    // Let the packager know the build is abandoned whatever the failure is
    // and propagate it.
    //
    try
    {
      validate ();

      if (verb >= 1)
        text << "building " << format_ << " package " << artifact_name ();

      resolve_paths ();
      stage ();

      // Documents with values that cannot be represented in their format
      // (line breaks in single-line fields and so on) fail to render.
      //
      try
      {
        generate ();
      }
      catch (const invalid_argument& e)
      {
        throw document_generation_error (path_cast<path> (tmp_dir_),
                                         e.what ());
      }

      paths ps (assemble ());

      binary_files r;
      for (path& p: ps)
      {
        binary_file f {to_string (format_), move (p), string ()};

        if (exists (f.path))
        {
          f.sha256 = sha256_file (f.path);

          if (metadata_)
            write_metadata (f);
        }
        else if (!executor_.simulated ())
          fail << "package " << f.path << " was not produced";

        r.push_back (move (f));
      }

      return r;
    }
    catch (...)
    {
      aborted ();
      throw;
    }
  }

  optional<string> packager::
  signing_identity () const
  {
    if (config_.sign_pkg ())
    {
      const optional<string>& id (config_.signing_identity ());

      if (id && !id->empty ())
        return *id;
    }

    return nullopt;
  }

  target_triplet packager::
  target () const
  {
    const string& a (config_.architecture ());

    try
    {
      return target_triplet (a);
    }
    catch (const invalid_argument&)
    {
      throw missing_required_configuration ("architecture",
                                            "'x86_64-linux-gnu'");
    }
  }

  dir_path packager::
  install_root (const dir_path& root) const
  {
    const dir_path& d (project_.install_dir);

    return d.absolute ()
      ? root / d.relative (d.root_directory ())
      : root / d;
  }

  void packager::
  stage_install_dir (const dir_path& root) const
  {
    const dir_path& d (project_.install_dir);

    if (!exists (d))
      fail << "installation directory " << d << " does not exist" <<
        info << "the project must be built before it can be packaged";

    cp_r (d, install_root (root));
  }

  optional<path> packager::
  script (const string& n) const
  {
    if (project_.package_scripts_path.empty ())
      return nullopt;

    path f (project_.package_scripts_path / n);

    if (!exists (f))
      return nullopt;

    return f;
  }

  bool packager::
  copy_script (const string& n, const path& to) const
  {
    optional<path> f (script (n));

    if (!f)
      return false;

    cp (*f, to);
    return true;
  }

  void packager::
  write_metadata (const binary_file& bf) const
  {
    path f (bf.path);
    f += ".metadata.json";

    if (verb >= 3)
      text << "write " << f;

    try
    {
      ofdstream os (f);
      json::stream_serializer s (os);

      s.begin_object ();
      {
        s.member ("basename",  bf.path.leaf ().string ());
        s.member ("format",    bf.type);
        s.member ("name",      project_.name);
        s.member ("version",   project_.version);
        s.member ("iteration", project_.iteration);
        s.member ("license",   project_.license);
        s.member ("arch",      config_.architecture ());
        s.member ("sha256",    bf.sha256);
      }
      s.end_object ();

      os << '\n';
      os.close ();
    }
    catch (const json::invalid_json_output& e)
    {
      throw document_generation_error (f, e.what ());
    }
    catch (const io_error& e)
    {
      throw document_generation_error (f, e.what ());
    }
  }

  unique_ptr<packager>
  make_packager (package_format f,
                 const project& p,
                 const configuration& c,
                 executor& e)
  {
    switch (f)
    {
    case package_format::mac_pkg:
      return unique_ptr<packager> (new packager_mac_pkg (p, c, e));
    case package_format::mac_dmg:
      return unique_ptr<packager> (new packager_mac_dmg (p, c, e));
    case package_format::deb:
      return unique_ptr<packager> (new packager_deb (p, c, e));
    case package_format::rpm:
      return unique_ptr<packager> (new packager_rpm (p, c, e));
    case package_format::msi:
      return unique_ptr<packager> (new packager_msi (p, c, e));
    case package_format::makeself:
      return unique_ptr<packager> (new packager_makeself (p, c, e));
    case package_format::solaris:
      return unique_ptr<packager> (new packager_solaris (p, c, e));
    }

    return nullptr; // Should never reach.
  }
}
