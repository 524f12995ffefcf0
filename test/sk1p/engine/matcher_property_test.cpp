#include <doctest/doctest.h>

#include "sk1p/engine/matcher.hpp"
#include "sk1p/engine/pattern_index.hpp"
#include "sk1p/engine/reference.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <random>
#include <thread>
#include <vector>

namespace {

using sk1p::engine::build_index;
using sk1p::engine::fast_path_mode;
using sk1p::engine::find_all;
using sk1p::engine::match_options;
using sk1p::engine::matches_at;
using sk1p::engine::pattern_index;
using sk1p::engine::reference_find_all;
using sk1p::engine::step_window;
using sk1p::test_helpers::natural_text;
using sk1p::test_helpers::periodic_text;
using sk1p::test_helpers::random_bytes;
using sk1p::test_helpers::slice;

std::vector<size_t> collect(
    const std::vector<uint8_t>& text, const pattern_index& index, const match_options& options
) {
  std::vector<size_t> out;
  for (size_t pos : find_all(text, index, 0, options)) {
    out.push_back(pos);
  }
  return out;
}

void check_against_reference(const std::vector<uint8_t>& pattern, const std::vector<uint8_t>& text) {
  auto index = build_index(pattern);
  REQUIRE(index.ok());

  auto expected = reference_find_all(text, pattern);

  for (fast_path_mode mode : {fast_path_mode::never, fast_path_mode::always, fast_path_mode::automatic}) {
    match_options options;
    options.fast_path = mode;
    auto found = collect(text, index.value, options);
    CHECK(found == expected);
    for (size_t pos : found) {
      CHECK(matches_at(text, pattern, pos));
    }
  }
}

// every advance must stop at or before the next true occurrence
void check_shift_safety(const std::vector<uint8_t>& pattern, const std::vector<uint8_t>& text, bool fast_path) {
  auto index = build_index(pattern);
  REQUIRE(index.ok());
  if (pattern.size() > text.size()) {
    return;
  }

  auto occurrences = reference_find_all(text, pattern);
  const size_t last_window = text.size() - pattern.size();
  size_t pos = 0;
  size_t violations = 0;

  while (pos <= last_window) {
    auto step = step_window(text, index.value, pos, fast_path);
    REQUIRE(step.shift >= 1);
    CHECK(step.matched == matches_at(text, pattern, pos));

    auto next = std::upper_bound(occurrences.begin(), occurrences.end(), pos);
    if (next != occurrences.end() && pos + step.shift > *next) {
      ++violations;
    }
    pos += step.shift;
  }

  CHECK(violations == 0);
}

} // namespace

TEST_CASE("matcher agrees with reference on natural language text") {
  std::mt19937 rng(101);
  auto text = natural_text(rng, 20000);

  for (size_t length : {1, 2, 3, 4, 5, 8, 13, 21, 34, 55, 89, 144, 200}) {
    check_against_reference(slice(rng, text, length), text);
  }
  for (const char* word : {"the", "there", "other", "mother", "either", "the cat", " a ", "xyz"}) {
    check_against_reference(sk1p::test_helpers::bytes_of(word), text);
  }
}

TEST_CASE("matcher agrees with reference on random byte text") {
  std::mt19937 rng(202);

  for (unsigned alphabet : {2u, 4u, 16u, 256u}) {
    auto text = random_bytes(rng, 8000, alphabet);
    for (int round = 0; round < 25; ++round) {
      std::uniform_int_distribution<size_t> length_dist(1, 200);
      size_t length = length_dist(rng);
      // mix patterns taken from the text with fresh random ones
      auto pattern = (round % 2 == 0) ? slice(rng, text, length)
                                      : random_bytes(rng, std::min<size_t>(length, 12), alphabet);
      check_against_reference(pattern, text);
    }
  }
}

TEST_CASE("matcher agrees with reference on periodic text") {
  auto all_a = periodic_text("a", 5000);
  for (size_t length : {1, 2, 3, 10, 64, 200}) {
    check_against_reference(periodic_text("a", length), all_a);
  }

  auto abab = periodic_text("ab", 5000);
  check_against_reference(periodic_text("ab", 7), abab);
  check_against_reference(periodic_text("ab", 8), abab);
  check_against_reference(periodic_text("ba", 8), abab);
  check_against_reference(periodic_text("abb", 9), abab);

  auto fib = periodic_text("abaababaabaab", 6000);
  check_against_reference(periodic_text("abaababaabaab", 26), fib);
  check_against_reference(periodic_text("aabaab", 12), fib);

  auto mostly_a = periodic_text("a", 3000);
  mostly_a[1500] = 'b';
  check_against_reference(periodic_text("a", 50), mostly_a);
  auto pattern = periodic_text("a", 50);
  pattern[25] = 'b';
  check_against_reference(pattern, mostly_a);
}

TEST_CASE("matcher never shifts past an occurrence") {
  std::mt19937 rng(303);

  for (int round = 0; round < 200; ++round) {
    unsigned alphabet = 2u + static_cast<unsigned>(round % 4);
    std::uniform_int_distribution<size_t> length_dist(1, 16);
    auto text = random_bytes(rng, 600, alphabet);
    auto pattern = (round % 3 == 0) ? random_bytes(rng, length_dist(rng), alphabet)
                                    : slice(rng, text, length_dist(rng));
    check_shift_safety(pattern, text, false);
    check_shift_safety(pattern, text, true);
  }

  check_shift_safety(periodic_text("a", 20), periodic_text("a", 400), false);
  check_shift_safety(periodic_text("aab", 21), periodic_text("aab", 400), false);
  check_shift_safety(periodic_text("aab", 21), periodic_text("aab", 400), true);
}

TEST_CASE("matcher finds occurrences at both ends of the text") {
  std::mt19937 rng(404);
  for (int round = 0; round < 50; ++round) {
    std::uniform_int_distribution<size_t> length_dist(1, 40);
    size_t length = length_dist(rng);
    auto pattern = random_bytes(rng, length, 3);
    auto text = random_bytes(rng, 300, 3);
    sk1p::test_helpers::write_bytes(text, 0, pattern);
    sk1p::test_helpers::write_bytes(text, text.size() - length, pattern);

    auto index = build_index(pattern);
    REQUIRE(index.ok());
    auto found = collect(text, index.value, match_options{});
    REQUIRE_FALSE(found.empty());
    CHECK(found.front() == 0);
    CHECK(found.back() == text.size() - length);
  }
}

TEST_CASE("one index can be shared by concurrent scans") {
  std::mt19937 rng(505);
  auto pattern = sk1p::test_helpers::bytes_of("there");
  auto index = build_index(pattern);
  REQUIRE(index.ok());

  std::vector<std::vector<uint8_t>> texts;
  std::vector<std::vector<size_t>> expected;
  for (int i = 0; i < 4; ++i) {
    texts.push_back(natural_text(rng, 50000));
    expected.push_back(reference_find_all(texts.back(), pattern));
  }

  std::vector<std::vector<size_t>> found(texts.size());
  std::vector<std::thread> workers;
  for (size_t i = 0; i < texts.size(); ++i) {
    workers.emplace_back([&, i]() {
      for (size_t pos : find_all(texts[i], index.value)) {
        found[i].push_back(pos);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  for (size_t i = 0; i < texts.size(); ++i) {
    CHECK(found[i] == expected[i]);
  }
}
