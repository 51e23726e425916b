#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace c3rt::engine {

// pem delimiters, matched byte for byte
inline constexpr std::string_view k_cert_begin_marker = "-----BEGIN CERTIFICATE-----";
inline constexpr std::string_view k_cert_end_marker = "-----END CERTIFICATE-----";

// only these four bytes may separate chained certificates within one bundle
constexpr bool is_bundle_whitespace(uint8_t byte) noexcept {
  return byte == ' ' || byte == '\t' || byte == '\r' || byte == '\n';
}

// half-open range [start, end) of one logical bundle in the blob
struct bundle {
  uint64_t start = 0;
  uint64_t end = 0;
  size_t certificates = 0;

  size_t size() const noexcept { return static_cast<size_t>(end - start); }
};

// nullopt selects every bundle in scan order
using selection = std::optional<std::vector<int64_t>>;

struct patch_options {
  bool strict = false;
};

enum class reconcile_outcome { exact_fit, padded, rejected };

const char* reconcile_outcome_name(reconcile_outcome outcome) noexcept;

struct plan_entry {
  size_t plan_index = 0;
  size_t bundle_index = 0;
  bundle target;
  size_t replacement_size = 0;
  reconcile_outcome outcome = reconcile_outcome::exact_fit;
  status rejection;

  size_t padding() const noexcept {
    return outcome == reconcile_outcome::padded ? target.size() - replacement_size : 0;
  }
};

struct patch_plan {
  std::vector<plan_entry> entries;
  size_t bundle_count = 0;
  size_t replacement_size = 0;
  bool strict = false;

  bool accepted() const noexcept {
    for (const auto& entry : entries) {
      if (entry.outcome == reconcile_outcome::rejected) {
        return false;
      }
    }
    return true;
  }
};

struct patch_record {
  size_t plan_index = 0;
  size_t bundle_index = 0;
  uint64_t start = 0;
  uint64_t end = 0;
  size_t original_size = 0;
  size_t replacement_size = 0;
  bool padded = false;
};

struct patch_report {
  std::vector<uint8_t> output;
  std::vector<patch_record> records;
  size_t patched = 0;
  size_t total_bundles = 0;
};

} // namespace c3rt::engine
