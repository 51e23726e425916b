#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace c3rt::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  malformed_input,
  no_bundles_found,
  index_out_of_range,
  empty_selection,
  oversize_replacement,
  undersize_replacement,
  io_error,
  internal_error
};

const char* error_code_name(error_code code) noexcept;

// structured details attached to a failure; unset fields do not apply
struct error_context {
  std::optional<int64_t> index;
  std::optional<size_t> bundle_count;
  std::optional<size_t> plan_index;
  std::optional<uint64_t> offset;
  std::optional<size_t> original_size;
  std::optional<size_t> replacement_size;
};

// status holds an error code, a human-readable message and the failure context
struct status {
  error_code code = error_code::ok;
  std::string message;
  error_context context;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message, error_context context = {}) {
  return status{code, std::move(message), std::move(context)};
}

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  engine::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message, error_context context = {}) {
  return result<T>{T{}, make_status(code, std::move(message), std::move(context))};
}

template <typename T> inline result<T> error_result(status failure) { return result<T>{T{}, std::move(failure)}; }

} // namespace c3rt::engine
