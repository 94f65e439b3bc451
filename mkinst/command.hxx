// file      : mkinst/command.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_COMMAND_HXX
#define MKINST_COMMAND_HXX

#include <map>

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

namespace mkinst
{
  // Native tool command line: the program and its arguments in the order
  // they were added (never reordered), plus the optional working directory.
  //
  class command_line
  {
  public:
    explicit
    command_line (string program, optional<dir_path> cwd = nullopt)
        : program_ (move (program)), cwd_ (move (cwd)) {}

    // Add the flag followed by its value (e.g., --identifier com.foo.bar).
    //
    command_line&
    option (string flag, string value)
    {
      args_.push_back (move (flag));
      args_.push_back (move (value));
      return *this;
    }

    // Add the value-less flag (e.g., -bb).
    //
    command_line&
    flag (string f)
    {
      args_.push_back (move (f));
      return *this;
    }

    // Add the positional argument.
    //
    command_line&
    argument (string a)
    {
      args_.push_back (move (a));
      return *this;
    }

    const string&
    program () const {return program_;}

    const strings&
    arguments () const {return args_;}

    const optional<dir_path>&
    cwd () const {return cwd_;}

    // Render the command line as a single line suitable for logging and
    // pasting into a POSIX shell. Arguments that are empty or contain
    // characters other than [A-Za-z0-9_./:=@%+,-] are double-quoted with
    // the ", \, $, and ` characters escaped.
    //
    string
    render () const;

  private:
    string program_;
    strings args_;
    optional<dir_path> cwd_;
  };

  inline ostream&
  operator<< (ostream& os, const command_line& c)
  {
    return os << c.render ();
  }

  // Quote the argument as described in command_line::render().
  //
  string
  quote_argument (const string&);

  // Native tool executor.
  //
  class executor
  {
  public:
    // Run the command capturing its stdout and stderr combined, and return
    // the captured output. Throw external_tool_failure if the program
    // cannot be executed or exits with non-zero status (or terminates
    // abnormally).
    //
    // The command line is printed at verbosity level 2 and above.
    //
    string
    run (const command_line&);

    // If simulate is not NULL, then instead of executing the commands record
    // them in the commands list and, if the program is found in the
    // failures map, fail with the specified exit code and output. If the
    // effect function is not empty, then it is called for each command that
    // did not fail, for example, to create the files the tool would
    // produce.
    //
    struct simulation
    {
      vector<command_line> commands;
      std::map<string, pair<int, string>> failures;
      function<void (const command_line&)> effect;
    };

    simulation* simulate_ = nullptr;

    bool
    simulated () const {return simulate_ != nullptr;}
  };
}

#endif // MKINST_COMMAND_HXX
