// file      : mkinst/mkinst.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <libbutl/json/serializer.hxx>

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>
#include <mkinst/command.hxx>
#include <mkinst/project.hxx>
#include <mkinst/version.hxx>
#include <mkinst/packager.hxx>
#include <mkinst/diagnostics.hxx>
#include <mkinst/configuration.hxx>
#include <mkinst/mkinst-options.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  struct result
  {
    package_format format;
    binary_files   bins;
  };

  // Parse the requested formats, failing on the first unknown one. Drop
  // duplicates and make sure mac_dmg is built after mac_pkg.
  //
  static vector<package_format>
  parse_formats (const strings& args)
  {
    vector<package_format> r;

    for (const string& a: args)
    {
      try
      {
        package_format f (to_package_format (a));

        if (find (r.begin (), r.end (), f) == r.end ())
          r.push_back (f);
      }
      catch (const invalid_argument&)
      {
        fail << "unknown package format '" << a << "'" <<
          info << "valid formats are mac_pkg, mac_dmg, deb, rpm, msi, "
               << "makeself, and solaris";
      }
    }

    auto pkg (find (r.begin (), r.end (), package_format::mac_pkg));
    auto dmg (find (r.begin (), r.end (), package_format::mac_dmg));

    if (pkg != r.end () && dmg != r.end () && dmg < pkg)
    {
      r.erase (dmg);
      r.insert (find (r.begin (), r.end (), package_format::mac_pkg) + 1,
                package_format::mac_dmg);
    }

    return r;
  }

  // Apply the configuration file and the command line overrides.
  //
  static void
  configure (configuration& cfg, const options& o)
  {
    if (o.config_specified ())
      cfg.load (o.config ());

    for (const string& v: o.config_value ())
    {
      size_t p (v.find ('='));

      if (p == string::npos || p == 0)
        fail << "invalid --config-value option value '" << v << "'" <<
          info << "expected <key>=<value>";

      cfg.assign (string (v, 0, p), string (v, p + 1));
    }

    if (o.package_dir_specified ())
      cfg.package_dir (o.package_dir ());

    if (o.package_tmp_specified ())
      cfg.package_tmp (o.package_tmp ());

    if (o.sign ())
      cfg.sign_pkg (true);

    if (o.signing_identity_specified ())
      cfg.signing_identity (optional<string> (o.signing_identity ()));

    if (o.architecture_specified ())
      cfg.architecture (o.architecture ());

    // Report all the missing required values at once.
    //
    vector<missing_required_configuration> ms (
      cfg.missing (cfg.required_keys ()));

    if (!ms.empty ())
    {
      for (const missing_required_configuration& e: ms)
        error << e.what () <<
          info << "specify it with --config-value " << e.key << '='
               << e.example;

      throw failed ();
    }

    // Resolve everything up front so that the packagers only read.
    //
    cfg.resolve ();
  }

  // Build the package for the specified format reporting the packaging
  // errors.
  //
  static binary_files
  build (package_format f,
         const project& prj,
         const configuration& cfg,
         executor& ex,
         const options& o)
  {
    try
    {
      unique_ptr<packager> p (make_packager (f, prj, cfg, ex));
      p->metadata (!o.no_metadata ());
      return p->build ();
    }
    catch (const missing_required_configuration& e)
    {
      fail << "unable to build " << f << " package: " << e.what () <<
        info << "specify " << e.key << " as " << e.example << endf;
    }
    catch (const path_resolution_error& e)
    {
      fail << "unable to build " << f << " package: " << e.what () << endf;
    }
    catch (const external_tool_failure& e)
    {
      diag_record dr (fail);
      dr << "unable to build " << f << " package: " << e.what ();

      if (!e.command.empty ())
        dr << info << "command line: " << e.command;

      string out (e.output);
      trim (out);

      if (!out.empty ())
        dr << info << "output:\n" << out;

      dr << endf;
    }
    catch (const document_generation_error& e)
    {
      fail << "unable to build " << f << " package: " << e.what () << endf;
    }
    catch (const invalid_argument& e)
    {
      fail << "unable to build " << f << " package: " << e << endf;
    }
  }

  static void
  print_json (ostream& os, const project& prj, const vector<result>& rs)
  {
    json::stream_serializer s (os);

    auto member = [&s] (const char* n, const string& v)
    {
      if (!v.empty ())
        s.member (n, v);
    };

    s.begin_object (); // mkinst_result
    {
      s.member_begin_object ("project");
      {
        member ("name", prj.name);
        member ("version", prj.version);
        s.member ("iteration", prj.iteration);
      }
      s.end_object ();

      s.member_begin_array ("packages");
      for (const result& r: rs)
      {
        s.begin_object (); // package
        {
          member ("format", to_string (r.format));

          s.member_begin_array ("files");
          for (const binary_file& bf: r.bins)
          {
            s.begin_object (); // file
            {
              member ("type", bf.type);
              member ("path", bf.path.string ());
              member ("sha256", bf.sha256);
            }
            s.end_object (); // file
          }
          s.end_array ();
        }
        s.end_object (); // package
      }
      s.end_array ();
    }
    s.end_object (); // mkinst_result

    os << endl;
  }

  static int
  main (int argc, char* argv[]);
}

int mkinst::
main (int argc, char* argv[])
try
{
  using namespace cli;

  argv_scanner scan (argc, argv);

  // Options can be intermixed with the formats.
  //
  options o;
  strings args;

  while (scan.more ())
  {
    o.parse (scan, unknown_mode::fail, unknown_mode::stop);

    if (scan.more ())
      args.push_back (scan.next ());
  }

  // Diagnostics verbosity.
  //
  verb = verbosity (o.verbose_specified ()
                    ? optional<uint16_t> (o.verbose ())
                    : nullopt,
                    o.V (),
                    o.v (),
                    o.quiet ());

  if (o.version ())
  {
    cout << "mkinst " << MKINST_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "host " << host_triplet << endl
         << "Copyright (c) " << MKINST_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  if (o.help ())
  {
    options::print_usage (cout);
    return 0;
  }

  if (args.empty ())
    fail << "package format argument expected" <<
      info << "run 'mkinst --help' for more information";

  if (o.structured_result_specified () && o.structured_result () != "json")
    fail << "unknown --structured-result format '"
         << o.structured_result () << "'";

  vector<package_format> fs (parse_formats (args));

  configuration cfg;
  configure (cfg, o);

  project prj;
  {
    path f (o.project_specified () ? o.project () : path ("project.manifest"));

    try
    {
      prj = load_project (f);
    }
    catch (const missing_required_configuration& e)
    {
      fail << "invalid project manifest " << f << ": " << e.what () <<
        info << "specify " << e.key << " as " << e.example;
    }
  }

  executor ex;
  executor::simulation sim;

  if (o.dry_run ())
    ex.simulate_ = &sim;

  vector<result> rs;
  for (package_format f: fs)
  {
    if (f == package_format::mac_dmg && !cfg.build_dmg ())
    {
      warn << "skipping mac_dmg package since build_dmg is false";
      continue;
    }

    rs.push_back (result {f, build (f, prj, cfg, ex, o)});

    if (o.dry_run ())
    {
      if (verb != 0 && verb < 2) // Already printed at level 2.
      {
        for (const command_line& c: sim.commands)
          text << c;
      }

      sim.commands.clear ();
    }
  }

  if (o.structured_result_specified ())
    print_json (cout, prj, rs);
  else if (verb)
  {
    for (const result& r: rs)
    {
      diag_record dr (text);

      dr << "generated " << r.format << " package"
         << (o.dry_run () ? " (dry run)" : "") << ':';

      for (const binary_file& f: r.bins)
        dr << "\n  " << f.path;
    }
  }

  return 0;
}
catch (const failed& e)
{
  return e.code; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return mkinst::main (argc, argv);
}
