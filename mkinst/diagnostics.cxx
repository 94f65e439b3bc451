// file      : mkinst/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  uint16_t verb = 1;

  uint16_t
  verbosity (const optional<uint16_t>& level, bool V, bool v, bool quiet)
  {
    if (level)
      return *level > 6 ? 6 : *level;

    return V ? 3 : v ? 2 : quiet ? 0 : 1;
  }

  // Print the type (error, warning, etc) and, for traces, the name of the
  // function being traced.
  //
  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr);
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
