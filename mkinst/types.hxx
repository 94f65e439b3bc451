// file      : mkinst/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_TYPES_HXX
#define MKINST_TYPES_HXX

#include <ios>           // ios_base::failure
#include <string>
#include <vector>
#include <memory>        // unique_ptr
#include <utility>       // pair
#include <cstddef>       // size_t
#include <cstdint>       // uint{16,64}_t
#include <istream>
#include <ostream>
#include <stdexcept>     // logic_error, invalid_argument, runtime_error
#include <functional>    // function
#include <system_error>

#include <libbutl/path.hxx>
#include <libbutl/sha256.hxx>
#include <libbutl/process.hxx>
#include <libbutl/optional.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>      // permissions, entry_type
#include <libbutl/target-triplet.hxx>

namespace mkinst
{
  using std::size_t;
  using std::uint16_t;
  using std::uint64_t;

  using std::pair;
  using std::string;
  using std::vector;
  using std::function;
  using std::unique_ptr;

  using std::istream;
  using std::ostream;

  using strings  = vector<string>;
  using cstrings = vector<const char*>;

  // Exceptions. Note that the packaging errors (missing configuration,
  // tool failures, etc) are in <mkinst/errors.hxx>.
  //
  using std::logic_error;
  using std::runtime_error;
  using std::system_error;
  using std::invalid_argument;
  using io_error = std::ios_base::failure;

  using butl::optional;
  using butl::nullopt;

  // Paths. Installation directories, staging trees, documents, and
  // artifacts are all represented with these.
  //
  using butl::path;
  using butl::dir_path;
  using butl::path_cast;
  using butl::invalid_path;

  using paths = vector<path>;

  // Files and the file system.
  //
  using butl::auto_fd;
  using butl::ifdstream;
  using butl::ofdstream;
  using butl::fdopen_mode;
  using butl::entry_type;
  using butl::permissions;

  // Native tool processes.
  //
  using butl::process;
  using butl::process_path;
  using butl::process_exit;
  using butl::process_error;

  using butl::sha256;
  using butl::target_triplet;
}

// Print paths in the canonical form, with the trailing slash for
// directories. Has to be in std:: to be found via ADL (libbutl provides its
// own default in butl::).
//
namespace std
{
  inline ostream&
  operator<< (ostream& os, const ::butl::path& p)
  {
    string r (p.representation ());
    ::butl::path::traits_type::canonicalize (r);
    return os << r;
  }
}

#endif // MKINST_TYPES_HXX
