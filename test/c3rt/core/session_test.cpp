#include <doctest/doctest.h>

#include "c3rt/engine/session.hpp"
#include "c3rt/engine/types.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

using c3rt::engine::error_code;
using c3rt::engine::patch_request;
using c3rt::engine::reconcile_outcome;
using c3rt::engine::session;
using c3rt::test_helpers::append;
using c3rt::test_helpers::make_cert;
using c3rt::test_helpers::make_filler;
using c3rt::test_helpers::to_bytes;

// firmware-like blob: filler, two-cert bundle, filler, one-cert bundle, filler
std::vector<uint8_t> make_firmware() {
  std::vector<uint8_t> blob = make_filler(64, 0x7f);
  append(blob, make_cert("MIIDdzCCAl+gAwIBAgIEAgAAuTANBgkqhkiG9w0BAQUFADBaMQswCQYDVQQGEwJJ"));
  append(blob, std::string_view("\r\n"));
  append(blob, make_cert("MIIDrzCCApegAwIBAgIQCDvgVpBCRrGhdWrJWZHHSjANBgkqhkiG9w0BAQUFADBh"));
  append(blob, std::string_view("\n"));
  append(blob, make_filler(32, 0x00));
  append(blob, make_filler(16, 0xc3));
  append(blob, make_cert("MIIBszCCAVmgAwIBAgIU"));
  append(blob, make_filler(48, 0xee));
  return blob;
}

bool bytes_equal(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b, uint64_t from, uint64_t to) {
  return std::equal(a.begin() + from, a.begin() + to, b.begin() + from);
}

} // namespace

TEST_CASE("session scans once and reports bundles") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);
  CHECK(sess.blob_size() == blob.size());

  auto bundles = sess.scan();
  REQUIRE(bundles.ok());
  REQUIRE(bundles.value.size() == 2);
  CHECK(bundles.value[0].start == 64);
  CHECK(bundles.value[0].certificates == 2);
  CHECK(bundles.value[1].certificates == 1);
  CHECK(bundles.value[0].end <= bundles.value[1].start);

  auto again = sess.scan();
  REQUIRE(again.ok());
  CHECK(again.value.size() == 2);
  CHECK(again.value[1].start == bundles.value[1].start);
}

TEST_CASE("session resolves selections against the scan") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);

  auto last = sess.select(std::vector<int64_t>{-1});
  REQUIRE(last.ok());
  REQUIRE(last.value.size() == 1);
  CHECK(last.value[0] == 1);

  auto out_of_range = sess.select(std::vector<int64_t>{5});
  CHECK(out_of_range.status.code == error_code::index_out_of_range);
}

TEST_CASE("session patches two bundles sized to the smaller one") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);
  auto bundles = sess.scan();
  REQUIRE(bundles.ok());
  REQUIRE(bundles.value.size() == 2);

  size_t smaller = std::min(bundles.value[0].size(), bundles.value[1].size());
  std::string cert = make_cert("MIIB");
  std::vector<uint8_t> replacement = to_bytes(cert);
  replacement.resize(smaller, '\n');

  patch_request request;
  request.indices = std::vector<int64_t>{0, 1};
  request.replacement = replacement;

  auto report = sess.patch(request);
  REQUIRE(report.ok());
  const auto& output = report.value.output;
  CHECK(output.size() == blob.size());
  CHECK(report.value.patched == 2);
  CHECK(report.value.total_bundles == 2);

  const auto& first = bundles.value[0];
  const auto& second = bundles.value[1];
  CHECK(bytes_equal(blob, output, 0, first.start));
  CHECK(bytes_equal(blob, output, first.end, second.start));
  CHECK(bytes_equal(blob, output, second.end, blob.size()));

  CHECK(std::equal(replacement.begin(), replacement.end(), output.begin() + first.start));
  CHECK(std::equal(replacement.begin(), replacement.end(), output.begin() + second.start));

  REQUIRE(report.value.records.size() == 2);
  CHECK(report.value.records[0].padded == (first.size() > smaller));
  CHECK(report.value.records[1].padded == (second.size() > smaller));
  CHECK(std::all_of(output.begin() + first.start + smaller, output.begin() + first.end, [](uint8_t b) {
    return b == 0x00;
  }));
}

TEST_CASE("session patches every bundle when no indices are given") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);
  auto replacement = to_bytes(make_cert("MIIB"));

  patch_request request;
  request.replacement = replacement;

  auto report = sess.patch(request);
  REQUIRE(report.ok());
  CHECK(report.value.patched == 2);
  REQUIRE(report.value.records.size() == 2);
  CHECK(report.value.records[0].bundle_index == 0);
  CHECK(report.value.records[1].bundle_index == 1);
  CHECK(report.value.output.size() == blob.size());

  // patched output still scans to the same ranges
  auto rescanned = session::for_blob(report.value.output).scan();
  REQUIRE(rescanned.ok());
  CHECK(rescanned.value.size() == 2);
}

TEST_CASE("session plan records request order") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);
  auto replacement = to_bytes(make_cert("MIIB"));

  patch_request request;
  request.indices = std::vector<int64_t>{1, 0, -1};
  request.replacement = replacement;

  auto plan = sess.plan(request);
  REQUIRE(plan.ok());
  REQUIRE(plan.value.entries.size() == 2);
  CHECK(plan.value.entries[0].bundle_index == 1);
  CHECK(plan.value.entries[1].bundle_index == 0);
  CHECK(plan.value.entries[0].outcome == reconcile_outcome::padded);
  CHECK(plan.value.accepted());
}

TEST_CASE("session strict mode rejects short replacements") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);
  auto replacement = to_bytes(make_cert("MIIB"));

  patch_request request;
  request.replacement = replacement;
  request.options.strict = true;

  auto report = sess.patch(request);
  CHECK_FALSE(report.ok());
  CHECK(report.status.code == error_code::undersize_replacement);
  CHECK(report.value.output.empty());
}

TEST_CASE("session reports blobs without bundles") {
  auto blob = make_filler(256, 0x90);
  auto sess = session::for_blob(blob);
  auto replacement = to_bytes(make_cert());

  auto bundles = sess.scan();
  REQUIRE(bundles.ok());
  CHECK(bundles.value.empty());

  patch_request request;
  request.replacement = replacement;
  auto report = sess.patch(request);
  CHECK_FALSE(report.ok());
  CHECK(report.status.code == error_code::no_bundles_found);
}

TEST_CASE("session surfaces malformed input") {
  auto blob = make_firmware();
  append(blob, c3rt::engine::k_cert_begin_marker);
  append(blob, std::string_view("\nMIIB"));
  auto sess = session::for_blob(blob);

  patch_request request;
  auto replacement = to_bytes(make_cert());
  request.replacement = replacement;

  auto report = sess.patch(request);
  CHECK_FALSE(report.ok());
  CHECK(report.status.code == error_code::malformed_input);
  CHECK(sess.select(std::nullopt).status.code == error_code::malformed_input);
}

TEST_CASE("session rejects an empty explicit selection") {
  auto blob = make_firmware();
  auto sess = session::for_blob(blob);
  auto replacement = to_bytes(make_cert("MIIB"));

  patch_request request;
  request.indices = std::vector<int64_t>{};
  request.replacement = replacement;

  auto report = sess.patch(request);
  CHECK_FALSE(report.ok());
  CHECK(report.status.code == error_code::empty_selection);
}
