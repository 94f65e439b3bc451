// file      : mkinst/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef MKINST_TYPES_PARSERS_HXX
#define MKINST_TYPES_PARSERS_HXX

#include <mkinst/types.hxx>

#include <mkinst/mkinst-options.hxx> // mkinst::cli namespace

namespace mkinst
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };
  }
}

#endif // MKINST_TYPES_PARSERS_HXX
