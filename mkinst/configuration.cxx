// file      : mkinst/configuration.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/configuration.hxx>

#include <libbutl/manifest-parser.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  // setting_base
  //
  setting_base::
  setting_base (configuration& c, const char* n, const char* e)
      : name_ (n), example_ (e)
  {
    c.settings_.push_back (this);
  }

  // setting<T>::assign_text()
  //
  template <>
  void setting<dir_path>::
  assign_text (const string& v)
  {
    try
    {
      dir_path d (v);

      if (d.empty ())
        throw invalid_argument ("empty directory path");

      (*this) (move (d));
    }
    catch (const invalid_path& e)
    {
      throw invalid_argument ("invalid directory path '" + e.path + "'");
    }
  }

  template <>
  void setting<string>::
  assign_text (const string& v)
  {
    if (v.empty ())
      throw invalid_argument ("empty value");

    (*this) (v);
  }

  template <>
  void setting<optional<string>>::
  assign_text (const string& v)
  {
    // Empty value means unset, similar to the nil default.
    //
    (*this) (v.empty () ? optional<string> () : optional<string> (v));
  }

  template <>
  void setting<bool>::
  assign_text (const string& v)
  {
    if (v == "true")
      (*this) (true);
    else if (v == "false")
      (*this) (false);
    else
      throw invalid_argument ("invalid boolean value '" + v +
                              "', expected 'true' or 'false'");
  }

  template <>
  void setting<uint64_t>::
  assign_text (const string& v)
  {
    if (v.empty () ||
        find_if (v.begin (), v.end (),
                 [] (char c) {return !digit (c);}) != v.end ())
      throw invalid_argument ("invalid unsigned integer value '" + v + "'");

    try
    {
      (*this) (static_cast<uint64_t> (stoull (v)));
    }
    catch (const out_of_range&)
    {
      throw invalid_argument ("out of range integer value '" + v + "'");
    }
  }

  // configuration
  //
  static dir_path
  default_base_dir ()
  {
#ifdef _WIN32
    return dir_path ("C:\\mkinst");
#else
    return dir_path ("/var/cache/mkinst");
#endif
  }

  configuration::
  configuration ()
      : base_dir (*this, "base_dir", default_base_dir ()),
        cache_dir (*this, "cache_dir",
                   [this] () {return base_dir () / dir_path ("cache");}),
        git_cache_dir (
          *this, "git_cache_dir",
          [this] ()
          {
            // Honor the deprecated setting if it was assigned explicitly.
            //
            return install_path_cache_dir.assigned ()
              ? install_path_cache_dir ()
              : base_dir () / dir_path ("cache") / dir_path ("git_cache");
          }),
        install_path_cache_dir (
          *this, "install_path_cache_dir",
          [this] ()
          {
            warn << "install_path_cache_dir is deprecated" <<
              info << "use git_cache_dir instead";

            return git_cache_dir ();
          }),
        source_dir (*this, "source_dir",
                    [this] () {return base_dir () / dir_path ("src");}),
        build_dir (*this, "build_dir",
                   [this] () {return base_dir () / dir_path ("build");}),
        package_dir (*this, "package_dir",
                     [this] () {return base_dir () / dir_path ("pkg");}),
        package_tmp (*this, "package_tmp",
                     [this] () {return base_dir () / dir_path ("pkg-tmp");}),
        project_dir (*this, "project_dir", dir_path ("config/projects")),
        software_dir (*this, "software_dir", dir_path ("config/software")),
        project_root (*this, "project_root",
                      [] () {return current_directory ();}),

        build_dmg (*this, "build_dmg", true),
        dmg_window_bounds (*this, "dmg_window_bounds",
                           string ("100, 100, 750, 600")),
        dmg_pkg_position (*this, "dmg_pkg_position", string ("535, 50")),
        sign_pkg (*this, "sign_pkg", false),
        signing_identity (*this, "signing_identity", optional<string> ()),

        use_s3_caching (*this, "use_s3_caching", false),
        s3_bucket (*this, "s3_bucket", required_setting, "'my_bucket'"),
        s3_access_key (*this, "s3_access_key", required_setting, "'ABCD1234'"),
        s3_secret_key (*this, "s3_secret_key", required_setting, "'EFGH5678'"),

        artifactory_endpoint (*this, "artifactory_endpoint",
                              required_setting, "'https://...'"),
        artifactory_username (*this, "artifactory_username",
                              required_setting, "'admin'"),
        artifactory_password (*this, "artifactory_password",
                              required_setting, "'password'"),
        artifactory_ssl_pem_file (*this, "artifactory_ssl_pem_file",
                                  optional<string> ()),
        artifactory_ssl_verify (*this, "artifactory_ssl_verify", true),
        artifactory_proxy_username (*this, "artifactory_proxy_username",
                                    optional<string> ()),
        artifactory_proxy_password (*this, "artifactory_proxy_password",
                                    optional<string> ()),
        artifactory_proxy_address (*this, "artifactory_proxy_address",
                                   optional<string> ()),
        artifactory_proxy_port (*this, "artifactory_proxy_port",
                                optional<string> ()),

        publish_s3_access_key (*this, "publish_s3_access_key",
                               required_setting, "'ABCD1234'"),
        publish_s3_secret_key (*this, "publish_s3_secret_key",
                               required_setting, "'EFGH5678'"),

        override_file (*this, "override_file", optional<string> ()),
        software_gem (*this, "software_gem", string ("omnibus-software")),
        solaris_compiler (*this, "solaris_compiler", optional<string> ()),

        append_timestamp (*this, "append_timestamp", true),
        build_retries (*this, "build_retries", uint64_t (3)),
        use_git_caching (*this, "use_git_caching", true),

        architecture (*this, "architecture",
                      [] () {return host_triplet.string ();})
  {
    install_path_cache_dir.deprecate ("git_cache_dir");
  }

  setting_base* configuration::
  find (const string& n)
  {
    auto i (find_if (settings_.begin (), settings_.end (),
                     [&n] (const setting_base* s) {return n == s->name ();}));

    return i != settings_.end () ? *i : nullptr;
  }

  const setting_base* configuration::
  find (const string& n) const
  {
    return const_cast<configuration&> (*this).find (n);
  }

  void configuration::
  assign (const string& n, const string& v)
  {
    setting_base* s (find (n));

    if (s == nullptr)
      fail << "unknown configuration setting '" << n << "'";

    if (s->replacement () != nullptr)
      warn << n << " is deprecated" <<
        info << "use " << s->replacement () << " instead";

    try
    {
      s->assign_text (v);
    }
    catch (const invalid_argument& e)
    {
      fail << "invalid " << n << " configuration value: " << e;
    }
  }

  void configuration::
  load (const path& f)
  {
    if (verb >= 3)
      text << "loading configuration from " << f;

    try
    {
      ifdstream ifs (f);
      manifest_parser p (ifs, f.string ());

      manifest_name_value nv (p.next ());

      // Make sure this is the start and we support the version.
      //
      if (!nv.name.empty ())
        fail << f << ':' << nv.name_line << ':' << nv.name_column << ": "
             << "start of configuration manifest expected";

      if (nv.value != "1")
        fail << f << ':' << nv.value_line << ':' << nv.value_column << ": "
             << "unsupported format version";

      for (nv = p.next (); !nv.empty (); nv = p.next ())
      {
        setting_base* s (find (nv.name));

        if (s == nullptr)
          fail << f << ':' << nv.name_line << ':' << nv.name_column << ": "
               << "unknown configuration setting '" << nv.name << "'";

        if (s->replacement () != nullptr)
          warn << f << ':' << nv.name_line << ':' << nv.name_column << ": "
               << nv.name << " is deprecated" <<
            info << "use " << s->replacement () << " instead";

        try
        {
          s->assign_text (nv.value);
        }
        catch (const invalid_argument& e)
        {
          fail << f << ':' << nv.value_line << ':' << nv.value_column << ": "
               << "invalid " << nv.name << " value: " << e;
        }
      }

      // Make sure this is the end.
      //
      nv = p.next ();
      if (!nv.empty ())
        fail << f << ':' << nv.name_line << ':' << nv.name_column << ": "
             << "single configuration manifest expected";

      ifs.close ();
    }
    catch (const manifest_parsing& e)
    {
      fail << e.name << ':' << e.line << ':' << e.column << ": "
           << e.description;
    }
    catch (const io_error& e)
    {
      fail << "unable to read from " << f << ": " << e;
    }
  }

  void configuration::
  resolve () const
  {
    for (const setting_base* s: settings_)
    {
      if (!s->required () && s->replacement () == nullptr)
        s->resolve ();
    }
  }

  void configuration::
  reset ()
  {
    for (setting_base* s: settings_)
      s->reset ();
  }

  strings configuration::
  required_keys () const
  {
    strings r;

    if (use_s3_caching ())
    {
      r.push_back (s3_bucket.name ());
      r.push_back (s3_access_key.name ());
      r.push_back (s3_secret_key.name ());
    }

    return r;
  }

  vector<missing_required_configuration> configuration::
  missing (const strings& ns) const
  {
    vector<missing_required_configuration> r;

    for (const string& n: ns)
    {
      const setting_base* s (find (n));

      if (s == nullptr)
        throw invalid_argument ("unknown configuration setting '" + n + "'");

      if (s->required () && !s->assigned ())
        r.emplace_back (n, s->example ());
    }

    return r;
  }
}
