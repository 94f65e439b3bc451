// file      : mkinst/errors.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_ERRORS_HXX
#define MKINST_ERRORS_HXX

#include <mkinst/types.hxx>

namespace mkinst
{
  // Packaging errors. All of them are fatal to the packager that threw and
  // are propagated to the caller as is. The description (what()) is a
  // complete sentence fragment suitable for the error diagnostics while the
  // remaining members carry the context for the info lines.
  //

  // A required configuration value or project metadata field is missing (or
  // unusable) and there is no safe fallback. The example is a value in the
  // form it should be specified, for example 'ABCD1234'.
  //
  class missing_required_configuration: public runtime_error
  {
  public:
    missing_required_configuration (string key, string example);

    string key;
    string example;
  };

  // A configured base directory (or a directory derived from it) cannot be
  // used: it is not a directory or it cannot be created or written to.
  //
  class path_resolution_error: public runtime_error
  {
  public:
    path_resolution_error (dir_path, string reason);

    dir_path path;
    string reason;
  };

  // A native packaging tool could not be executed or exited with non-zero
  // status. The exit code is -1 if the program could not be started or was
  // terminated abnormally. The output is the tool's stdout and stderr
  // combined (or the system error description if it could not be started).
  // The command is the rendered command line, if available.
  //
  class external_tool_failure: public runtime_error
  {
  public:
    external_tool_failure (string program,
                           int exit_code,
                           string output,
                           string command = string ());

    string program;
    int exit_code;
    string output;
    string command;
  };

  // A metadata document cannot be rendered or written.
  //
  class document_generation_error: public runtime_error
  {
  public:
    document_generation_error (mkinst::path, string reason);

    mkinst::path path;
    string reason;
  };
}

#endif // MKINST_ERRORS_HXX
