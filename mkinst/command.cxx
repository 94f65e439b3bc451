// file      : mkinst/command.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/command.hxx>

#include <cstdlib> // exit()

#include <mkinst/errors.hxx>
#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  string
  quote_argument (const string& a)
  {
    auto safe = [] (char c)
    {
      return alnum (c) || (c != '\0' && strchr ("_./:=@%+,-", c) != nullptr);
    };

    if (!a.empty () && find_if_not (a.begin (), a.end (), safe) == a.end ())
      return a;

    string r ("\"");
    for (char c: a)
    {
      if (c == '"' || c == '\\' || c == '$' || c == '`')
        r += '\\';

      r += c;
    }
    r += '"';

    return r;
  }

  string command_line::
  render () const
  {
    string r (quote_argument (program_));

    for (const string& a: args_)
    {
      r += ' ';
      r += quote_argument (a);
    }

    return r;
  }

  string executor::
  run (const command_line& c)
  {
    const string& p (c.program ());

    if (verb >= 2)
    {
      diag_record dr (text);
      dr << c;

      if (c.cwd ())
        dr << " (in " << *c.cwd () << ')';
    }

    if (simulate_ != nullptr)
    {
      simulate_->commands.push_back (c);

      auto i (simulate_->failures.find (p));
      if (i != simulate_->failures.end ())
        throw external_tool_failure (p,
                                     i->second.first,
                                     i->second.second,
                                     c.render ());

      if (simulate_->effect)
        simulate_->effect (c);

      return string ();
    }

    cstrings args {p.c_str ()};
    for (const string& a: c.arguments ())
      args.push_back (a.c_str ());
    args.push_back (nullptr);

    try
    {
      process_path pp (process::path_search (args[0]));

      // Combine stderr with stdout and capture both. Redirect stdin to
      // /dev/null to make sure there are no prompts of any kind.
      //
      process pr (pp,
                  args.data (),
                  -2 /* stdin */,
                  -1 /* stdout */,
                  1  /* stderr */,
                  c.cwd () ? c.cwd ()->string ().c_str () : nullptr);

      string o;
      try
      {
        // Do not throw when eofbit is set (end of stream is reached), and
        // when failbit is set (read() failed to extract any character).
        //
        ifdstream is (move (pr.in_ofd), ifdstream::badbit);
        o = is.read_text ();
        is.close ();
      }
      catch (const io_error& e)
      {
        // If the child failed, then its exit status is what matters.
        //
        if (pr.wait ())
          throw external_tool_failure (p,
                                       -1,
                                       string ("unable to read output: ") +
                                       e.what (),
                                       c.render ());
      }

      if (!pr.wait ())
      {
        const process_exit& e (*pr.exit);
        throw external_tool_failure (p,
                                     e.normal () ? e.code () : -1,
                                     move (o),
                                     c.render ());
      }

      return o;
    }
    catch (const process_error& e)
    {
      // Failed to exec in the child. The parent will report.
      //
      if (e.child)
        exit (1);

      throw external_tool_failure (p, -1, e.what (), c.render ());
    }
  }
}
