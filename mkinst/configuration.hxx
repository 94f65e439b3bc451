// file      : mkinst/configuration.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_CONFIGURATION_HXX
#define MKINST_CONFIGURATION_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>

namespace mkinst
{
  class configuration;

  // A named configuration setting.
  //
  // The value of a setting is either assigned explicitly (from the
  // configuration file, command line, or programmatically) or comes from its
  // default, which is either a literal value or a function evaluated lazily
  // on the first access. Either way the value is resolved once and then
  // memoized until the setting is reset. A setting without a default is
  // required: accessing it before it is assigned throws
  // missing_required_configuration.
  //
  // The base (untyped) interface is used for the lookup by name and for
  // assigning values from their textual representation.
  //
  class setting_base
  {
  public:
    const char*
    name () const {return name_;}

    // Example value used in diagnostics for required settings, NULL for
    // settings with default.
    //
    const char*
    example () const {return example_;}

    bool
    required () const {return example_ != nullptr;}

    // If not NULL, then the setting is deprecated in favor of the one with
    // this name.
    //
    const char*
    replacement () const {return replacement_;}

    void
    deprecate (const char* replacement) {replacement_ = replacement;}

    virtual bool
    assigned () const = 0;

    // Assign the value from its textual representation. Throw
    // invalid_argument if the value is not valid for this setting.
    //
    virtual void
    assign_text (const string&) = 0;

    // Evaluate and memoize the default value unless the value is already
    // assigned or resolved. Throw missing_required_configuration for
    // unassigned required settings.
    //
    virtual void
    resolve () const = 0;

    // Forget the assigned or memoized value.
    //
    virtual void
    reset () = 0;

    setting_base (const setting_base&) = delete;
    setting_base& operator= (const setting_base&) = delete;

  protected:
    setting_base (configuration&, const char* name, const char* example);

    virtual
    ~setting_base () = default;

  private:
    const char* name_;
    const char* example_;
    const char* replacement_ = nullptr;
  };

  struct required_setting_t {};
  const required_setting_t required_setting {};

  template <typename T>
  class setting: public setting_base
  {
  public:
    using value_type = T;
    using default_function = function<T ()>;

    setting (configuration& c, const char* n, T v)
        : setting_base (c, n, nullptr), literal_ (move (v)) {}

    setting (configuration& c, const char* n, default_function f)
        : setting_base (c, n, nullptr), default_ (move (f)) {}

    setting (configuration& c,
             const char* n,
             required_setting_t,
             const char* example)
        : setting_base (c, n, example) {}

    // Return the value resolving the default if necessary.
    //
    const T&
    operator() () const
    {
      resolve ();
      return *value_;
    }

    // Assign the value explicitly, overriding the default.
    //
    void
    operator() (T v)
    {
      value_ = move (v);
      assigned_ = true;
    }

    virtual bool
    assigned () const override {return assigned_;}

    virtual void
    assign_text (const string&) override;

    virtual void
    resolve () const override
    {
      if (value_)
        return;

      if (default_)
        value_ = default_ ();
      else if (literal_)
        value_ = *literal_;
      else
        throw missing_required_configuration (name (), example ());
    }

    virtual void
    reset () override
    {
      value_ = nullopt;
      assigned_ = false;
    }

  private:
    optional<T> literal_;
    default_function default_;

    mutable optional<T> value_;
    bool assigned_ = false;
  };

  template <> void setting<dir_path>::assign_text (const string&);
  template <> void setting<string>::assign_text (const string&);
  template <> void setting<optional<string>>::assign_text (const string&);
  template <> void setting<bool>::assign_text (const string&);
  template <> void setting<uint64_t>::assign_text (const string&);

  // The packaging configuration.
  //
  // Note that an instance is not copyable since the lazy defaults refer to
  // other settings of the same instance.
  //
  class configuration
  {
    friend class setting_base;

    // Settings register themselves here on construction so this member must
    // be declared (and thus constructed) before any of them.
    //
    vector<setting_base*> settings_;

  public:
    configuration ();

    configuration (const configuration&) = delete;
    configuration& operator= (const configuration&) = delete;

    // Directories.
    //
    // The base directory where intermediate data is stored. Other
    // directories are derived from it unless specified explicitly.
    //
    setting<dir_path> base_dir;
    setting<dir_path> cache_dir;
    setting<dir_path> git_cache_dir;
    setting<dir_path> install_path_cache_dir; // Deprecated: git_cache_dir.
    setting<dir_path> source_dir;
    setting<dir_path> build_dir;

    // The directory where the final packages are placed and the directory
    // where packagers store their intermediate products (each in its own
    // <package_tmp>/<format>/ subdirectory).
    //
    setting<dir_path> package_dir;
    setting<dir_path> package_tmp;

    setting<dir_path> project_dir;  // Relative to project_root.
    setting<dir_path> software_dir; // Relative to project_root.
    setting<dir_path> project_root;

    // Mac OS pkg/dmg.
    //
    setting<bool>             build_dmg;
    setting<string>           dmg_window_bounds;
    setting<string>           dmg_pkg_position;
    setting<bool>             sign_pkg;
    setting<optional<string>> signing_identity;

    // S3 caching.
    //
    setting<bool>   use_s3_caching;
    setting<string> s3_bucket;
    setting<string> s3_access_key;
    setting<string> s3_secret_key;

    // Artifactory publisher.
    //
    setting<string>           artifactory_endpoint;
    setting<string>           artifactory_username;
    setting<string>           artifactory_password;
    setting<optional<string>> artifactory_ssl_pem_file;
    setting<bool>             artifactory_ssl_verify;
    setting<optional<string>> artifactory_proxy_username;
    setting<optional<string>> artifactory_proxy_password;
    setting<optional<string>> artifactory_proxy_address;
    setting<optional<string>> artifactory_proxy_port;

    // S3 publisher.
    //
    setting<string> publish_s3_access_key;
    setting<string> publish_s3_secret_key;

    // Miscellaneous.
    //
    setting<optional<string>> override_file;
    setting<string>           software_gem;
    setting<optional<string>> solaris_compiler;

    // Build.
    //
    setting<bool>     append_timestamp;
    setting<uint64_t> build_retries;
    setting<bool>     use_git_caching;

    // Target architecture as a target triplet (host by default). Each
    // packager maps it to its platform spelling.
    //
    setting<string> architecture;

  public:
    // Return the setting with the specified name or NULL if there is none.
    //
    setting_base*
    find (const string& name);

    const setting_base*
    find (const string& name) const;

    const vector<setting_base*>&
    settings () const {return settings_;}

    // Assign the setting value from its textual representation. Issue
    // diagnostics and fail if the name is unknown or the value is invalid.
    // Warn if the setting is deprecated.
    //
    void
    assign (const string& name, const string& value);

    // Load the configuration file. It has the manifest format with the
    // setting names as manifest value names, for example:
    //
    // : 1
    // package_dir: /home/build/pkg
    // sign_pkg: true
    // signing_identity: Developer ID Installer: Example Inc
    //
    // Issue diagnostics and fail on errors.
    //
    void
    load (const path&);

    // Resolve (and memoize) the values of all the non-deprecated settings
    // that have defaults. After that accessing such settings doesn't modify
    // the instance, which makes it safe to share between threads.
    //
    void
    resolve () const;

    // Reset all the settings to their defaults.
    //
    void
    reset ();

    // Return the names of the required settings that are needed with the
    // current toggles (for example, the S3 credentials if S3 caching is
    // enabled).
    //
    strings
    required_keys () const;

    // Return the list of errors for the specified required settings that are
    // not assigned. Throw invalid_argument if a name is unknown.
    //
    vector<missing_required_configuration>
    missing (const strings& names) const;

  };
}

#endif // MKINST_CONFIGURATION_HXX
