#include "result.hpp"

namespace c3rt::engine {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::malformed_input:
    return "malformed_input";
  case error_code::no_bundles_found:
    return "no_bundles_found";
  case error_code::index_out_of_range:
    return "index_out_of_range";
  case error_code::empty_selection:
    return "empty_selection";
  case error_code::oversize_replacement:
    return "oversize_replacement";
  case error_code::undersize_replacement:
    return "undersize_replacement";
  case error_code::io_error:
    return "io_error";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

} // namespace c3rt::engine
