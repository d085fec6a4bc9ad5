#include "ngx_cache_inspect/record_extractor.hpp"

#include "fixtures.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace ngx_cache_inspect;

namespace {
const std::string kHttpHeaders =
    "HTTP/1.1 200 OK\r\nContent-Length:5\r\n\r\n";
} // namespace

TEST_CASE("end-to-end: key, headers and body slices", "[extract]") {
  REQUIRE(kHttpHeaders.size() == 37);
  auto file = fixtures::build_file(fixtures::basic_header(), "\nKEY: abc123\n",
                                   kHttpHeaders, "hello");
  auto h = decode_header(file);
  REQUIRE(h.has_value());
  CHECK(h->header_start == 349);
  CHECK(h->body_start == 386);
  REQUIRE(h->valid_sec.has_value());
  CHECK(*h->valid_sec == 1700000000);
  CHECK_FALSE(h->etag.has_value());
  CHECK_FALSE(h->vary.has_value());
  CHECK_FALSE(h->variant.has_value());

  auto rec = extract_record(*h, file);
  REQUIRE(rec.has_value());
  CHECK(rec->key == "abc123");
  CHECK(rec->http_headers == kHttpHeaders);
  CHECK(rec->body == std::vector<std::uint8_t>{'h', 'e', 'l', 'l', 'o'});
}

TEST_CASE("key region must end exactly at header_start", "[extract][key]") {
  auto file = fixtures::build_file(fixtures::basic_header(), "\nKEY: abc123\n",
                                   "", "");
  CacheHeader h = *decode_header(file);
  h.header_start = 400;
  h.body_start = 450;
  file.resize(450, 'x');
  Error err;
  CHECK_FALSE(extract_record(h, file, &err).has_value());
  CHECK(err.kind == ErrorKind::BadKeyDelimiter);
}

TEST_CASE("key delimiters are required", "[extract][key]") {
  const std::vector<std::string> bad = {
      "KEY: abc\n", "\nKEY:abc\n", "\nkey: abc\n", "\nKEY: abc",
      "\nKEY: abc\r", "\nKEY: ", "", "\n"};
  for (const auto &region : bad) {
    auto file = fixtures::build_file(fixtures::basic_header(), region,
                                     kHttpHeaders, "");
    auto h = decode_header(file);
    REQUIRE(h.has_value());
    Error err;
    CHECK_FALSE(extract_record(*h, file, &err).has_value());
    CHECK(err.kind == ErrorKind::BadKeyDelimiter);
  }
}

TEST_CASE("empty key and empty regions are accepted", "[extract][key]") {
  auto file =
      fixtures::build_file(fixtures::basic_header(), "\nKEY: \n", "", "");
  auto h = decode_header(file);
  REQUIRE(h.has_value());
  auto rec = extract_record(*h, file);
  REQUIRE(rec.has_value());
  CHECK(rec->key.empty());
  CHECK(rec->http_headers.empty());
  CHECK(rec->body.empty());
}

TEST_CASE("key keeps inner newlines and spaces", "[extract][key]") {
  auto file = fixtures::build_file(fixtures::basic_header(),
                                   "\nKEY: http GET\nexample.com/a b\n",
                                   kHttpHeaders, "");
  auto rec = extract_record(*decode_header(file), file);
  REQUIRE(rec.has_value());
  CHECK(rec->key == "http GET\nexample.com/a b");
}

TEST_CASE("body_start beyond the file is a truncation", "[extract][bounds]") {
  auto file = fixtures::build_file(fixtures::basic_header(), "\nKEY: k\n",
                                   kHttpHeaders, "body");
  auto h = decode_header(file);
  REQUIRE(h.has_value());
  file.resize(h->body_start - 1);
  Error err;
  CHECK_FALSE(extract_record(*h, file, &err).has_value());
  CHECK(err.kind == ErrorKind::TruncatedFile);

  file.resize(h->header_start - 2);
  Error err2;
  CHECK_FALSE(extract_record(*h, file, &err2).has_value());
  CHECK(err2.kind == ErrorKind::TruncatedFile);
}

TEST_CASE("inconsistent offsets are rejected before slicing",
          "[extract][bounds]") {
  auto file = fixtures::build_file(fixtures::basic_header(), "\nKEY: k\n",
                                   kHttpHeaders, "");
  CacheHeader h = *decode_header(file);
  h.body_start = static_cast<std::uint16_t>(h.header_start - 1);
  Error err;
  CHECK_FALSE(extract_record(h, file, &err).has_value());
  CHECK(err.kind == ErrorKind::InvalidOffsets);
}

TEST_CASE("non-ASCII header block and key fail", "[extract][ascii]") {
  auto file = fixtures::build_file(fixtures::basic_header(), "\nKEY: k\n",
                                   "X-Name: caf\xc3\xa9\r\n\r\n", "");
  auto h = decode_header(file);
  REQUIRE(h.has_value());
  Error err;
  CHECK_FALSE(extract_record(*h, file, &err).has_value());
  CHECK(err.kind == ErrorKind::NonAsciiText);

  auto file2 = fixtures::build_file(fixtures::basic_header(),
                                    "\nKEY: \xff\n", kHttpHeaders, "");
  Error err2;
  CHECK_FALSE(extract_record(*decode_header(file2), file2, &err2).has_value());
  CHECK(err2.kind == ErrorKind::NonAsciiText);
}

TEST_CASE("body is copied verbatim", "[extract][body]") {
  std::string body;
  for (int i = 0; i < 256; ++i)
    body.push_back(static_cast<char>(i));
  auto file = fixtures::build_file(fixtures::basic_header(), "\nKEY: bin\n",
                                   kHttpHeaders, body);
  auto rec = extract_record(*decode_header(file), file);
  REQUIRE(rec.has_value());
  REQUIRE(rec->body.size() == 256);
  CHECK(rec->body[0] == 0x00);
  CHECK(rec->body[0x80] == 0x80);
  CHECK(rec->body[255] == 0xff);
}
