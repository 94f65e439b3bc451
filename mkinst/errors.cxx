// file      : mkinst/errors.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/errors.hxx>

#include <utility> // move()

using namespace std;

namespace mkinst
{
  missing_required_configuration::
  missing_required_configuration (string k, string e)
      : runtime_error ("missing required configuration value " + k),
        key (move (k)),
        example (move (e))
  {
  }

  path_resolution_error::
  path_resolution_error (dir_path p, string r)
      : runtime_error ("unable to use directory " + p.representation () +
                       ": " + r),
        path (move (p)),
        reason (move (r))
  {
  }

  static string
  describe_tool_failure (const string& p, int c)
  {
    return c == -1
      ? "unable to execute " + p
      : p + " exited with code " + to_string (c);
  }

  external_tool_failure::
  external_tool_failure (string p, int c, string o, string cmd)
      : runtime_error (describe_tool_failure (p, c)),
        program (move (p)),
        exit_code (c),
        output (move (o)),
        command (move (cmd))
  {
  }

  document_generation_error::
  document_generation_error (mkinst::path p, string r)
      : runtime_error ("unable to generate " + p.string () + ": " + r),
        path (move (p)),
        reason (move (r))
  {
  }
}
