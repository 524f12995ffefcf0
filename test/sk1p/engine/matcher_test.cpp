#include <doctest/doctest.h>

#include "sk1p/engine/matcher.hpp"
#include "sk1p/engine/pattern_index.hpp"
#include "test_helpers.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace {

using sk1p::engine::byte_view;
using sk1p::engine::build_index;
using sk1p::engine::fast_path_mode;
using sk1p::engine::find_all;
using sk1p::engine::find_first;
using sk1p::engine::match_cursor;
using sk1p::engine::match_options;

std::vector<size_t> all_matches(std::string_view pattern, std::string_view text, size_t start = 0,
                                const match_options& options = {}) {
  auto index = build_index(pattern);
  REQUIRE(index.ok());
  std::vector<size_t> out;
  for (size_t pos : find_all(byte_view(text), index.value, start, options)) {
    out.push_back(pos);
  }
  return out;
}

} // namespace

TEST_CASE("matcher finds overlapping periodic matches") {
  CHECK(all_matches("abab", "ababab") == std::vector<size_t>{0, 2});
  CHECK(all_matches("aaaa", "aaaaaa") == std::vector<size_t>{0, 1, 2});
}

TEST_CASE("matcher reports no matches for absent patterns") {
  CHECK(all_matches("xyz", "abcdef").empty());
}

TEST_CASE("matcher finds words in natural text") {
  CHECK(all_matches("the", "the cat sat on the mat") == std::vector<size_t>{0, 15});
}

TEST_CASE("matcher handles pattern equal to text") {
  CHECK(all_matches("needle", "needle") == std::vector<size_t>{0});
}

TEST_CASE("matcher handles text shorter than pattern") {
  CHECK(all_matches("needle", "need").empty());
  CHECK(all_matches("needle", "").empty());

  auto index = build_index(std::string_view("needle"));
  REQUIRE(index.ok());
  CHECK_FALSE(find_first(byte_view("need"), index.value).has_value());
}

TEST_CASE("matcher finds a match at the last valid position") {
  CHECK(all_matches("end", "the very end") == std::vector<size_t>{9});
  CHECK(all_matches("z", "aaaaz") == std::vector<size_t>{4});
}

TEST_CASE("matcher single byte patterns") {
  CHECK(all_matches("a", "banana") == std::vector<size_t>{1, 3, 5});
  CHECK(all_matches("n", "banana") == std::vector<size_t>{2, 4});
}

TEST_CASE("matcher honours start offsets") {
  CHECK(all_matches("the", "the cat sat on the mat", 1) == std::vector<size_t>{15});
  CHECK(all_matches("the", "the cat sat on the mat", 15) == std::vector<size_t>{15});
  CHECK(all_matches("the", "the cat sat on the mat", 16).empty());
}

TEST_CASE("matcher treats out of range start as no match") {
  auto index = build_index(std::string_view("a"));
  REQUIRE(index.ok());
  auto text = byte_view("aaa");

  CHECK(find_first(text, index.value, 3) == std::nullopt);
  CHECK(find_first(text, index.value, 4) == std::nullopt);
  CHECK(find_first(text, index.value, static_cast<size_t>(-1)) == std::nullopt);
  CHECK(find_first(text, index.value, 2) == std::optional<size_t>(2));
}

TEST_CASE("find_first restarts after the previous match") {
  auto index = build_index(std::string_view("aa"));
  REQUIRE(index.ok());
  auto text = byte_view("aaaa");

  std::vector<size_t> found;
  size_t start = 0;
  while (auto pos = find_first(text, index.value, start)) {
    found.push_back(*pos);
    start = *pos + 1;
  }
  CHECK(found == std::vector<size_t>{0, 1, 2});
}

TEST_CASE("match cursor yields matches one at a time") {
  auto index = build_index(std::string_view("ab"));
  REQUIRE(index.ok());
  auto text = byte_view("xxabxxabab");

  match_cursor cursor(text, index.value);
  CHECK_FALSE(cursor.exhausted());
  CHECK(cursor.next() == std::optional<size_t>(2));
  CHECK(cursor.next() == std::optional<size_t>(6));
  CHECK(cursor.next() == std::optional<size_t>(8));
  CHECK(cursor.next() == std::nullopt);
  CHECK(cursor.exhausted());
  CHECK(cursor.next() == std::nullopt);
}

TEST_CASE("match cursor can be abandoned early") {
  auto index = build_index(std::string_view("a"));
  REQUIRE(index.ok());
  auto text = byte_view("aaaaaaaaaa");

  size_t seen = 0;
  for (size_t pos : find_all(text, index.value)) {
    CHECK(pos == seen);
    if (++seen == 3) {
      break;
    }
  }
  CHECK(seen == 3);
}

TEST_CASE("match range supports standard iteration") {
  auto index = build_index(std::string_view("na"));
  REQUIRE(index.ok());

  auto range = find_all(byte_view("banana"), index.value);
  std::vector<size_t> found(range.begin(), range.end());
  CHECK(found == std::vector<size_t>{2, 4});
}

TEST_CASE("matcher results do not depend on the fast path mode") {
  match_options always;
  always.fast_path = fast_path_mode::always;
  match_options never;
  never.fast_path = fast_path_mode::never;

  std::string_view text = "abracadabra abracadabra cadabra";
  for (std::string_view pattern : {"abra", "cad", "a", "abracadabra", "ra c", "zzz"}) {
    CHECK(all_matches(pattern, text, 0, always) == all_matches(pattern, text, 0, never));
  }
}

TEST_CASE("match options decide when the fast path applies") {
  match_options options;
  CHECK(options.fast_path_enabled(1));
  CHECK(options.fast_path_enabled(options.fast_path_limit));
  CHECK_FALSE(options.fast_path_enabled(options.fast_path_limit + 1));

  options.fast_path = fast_path_mode::always;
  CHECK(options.fast_path_enabled(1 << 20));

  options.fast_path = fast_path_mode::never;
  CHECK_FALSE(options.fast_path_enabled(1));
}

TEST_CASE("matcher finds binary patterns with zero bytes") {
  std::vector<uint8_t> pattern = {0x00, 0xff, 0x00};
  std::vector<uint8_t> text = {0x00, 0x00, 0xff, 0x00, 0xff, 0x00, 0x00};
  auto index = build_index(pattern);
  REQUIRE(index.ok());

  std::vector<size_t> found;
  for (size_t pos : find_all(text, index.value)) {
    found.push_back(pos);
  }
  CHECK(found == std::vector<size_t>{1, 3});
  CHECK(sk1p::engine::count_matches(text, index.value) == 2);
}
