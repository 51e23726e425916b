#include "types.hpp"

namespace c3rt::engine {

const char* reconcile_outcome_name(reconcile_outcome outcome) noexcept {
  switch (outcome) {
  case reconcile_outcome::exact_fit:
    return "exact_fit";
  case reconcile_outcome::padded:
    return "padded";
  case reconcile_outcome::rejected:
    return "rejected";
  }
  return "unknown";
}

} // namespace c3rt::engine
