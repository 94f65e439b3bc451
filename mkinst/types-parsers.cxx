// file      : mkinst/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/types-parsers.hxx>

#include <mkinst/utility.hxx> // move(), make_pair()

namespace mkinst
{
  namespace cli
  {
    // Return the option value, throwing if it is missing.
    //
    static pair<const char*, const char*>
    option_value (scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      return make_pair (o, s.next ());
    }

    void parser<path>::
    parse (path& x, bool& xs, scanner& s)
    {
      pair<const char*, const char*> ov (option_value (s));

      try
      {
        path p (ov.second);

        // The manifest and configuration files are read, so the path must
        // name a file rather than a directory.
        //
        if (p.empty () || p.to_directory ())
          throw invalid_value (ov.first, ov.second);

        x = move (p);
        xs = true;
      }
      catch (const invalid_path&)
      {
        throw invalid_value (ov.first, ov.second);
      }
    }

    void parser<dir_path>::
    parse (dir_path& x, bool& xs, scanner& s)
    {
      pair<const char*, const char*> ov (option_value (s));

      try
      {
        dir_path d (ov.second);

        if (d.empty ())
          throw invalid_value (ov.first, ov.second);

        x = move (d);
        xs = true;
      }
      catch (const invalid_path&)
      {
        throw invalid_value (ov.first, ov.second);
      }
    }
  }
}
