#include <doctest/doctest.h>

#include "sk1p/utils/file_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using sk1p::engine::error_code;

std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / ("sk1p_" + name)).string();
}

} // namespace

TEST_CASE("file utils round trip a binary file") {
  std::string path = temp_path("file_utils_roundtrip.bin");
  std::vector<uint8_t> data = {0x00, 0x01, 0xff, '\n', '\r', 0x7f};
  REQUIRE(sk1p::utils::write_file(path, data));

  auto size = sk1p::utils::file_size(path);
  REQUIRE(size.ok());
  CHECK(size.value == data.size());

  auto read = sk1p::utils::read_file(path);
  REQUIRE(read.ok());
  CHECK(read.value == data);

  std::remove(path.c_str());
}

TEST_CASE("file utils read ranges and report short reads") {
  std::string path = temp_path("file_utils_range.bin");
  std::vector<uint8_t> data = {'a', 'b', 'c', 'd', 'e', 'f'};
  REQUIRE(sk1p::utils::write_file(path, data));

  std::ifstream file(path, std::ios::binary);
  REQUIRE(file.is_open());

  std::vector<uint8_t> out;
  auto status = sk1p::utils::read_range(file, 2, 3, out);
  REQUIRE(status.ok());
  CHECK(out == std::vector<uint8_t>{'c', 'd', 'e'});

  // a failed read must not poison later reads
  auto past_end = sk1p::utils::read_range(file, 4, 10, out);
  CHECK(past_end.code == error_code::io_error);
  auto again = sk1p::utils::read_range(file, 0, 2, out);
  REQUIRE(again.ok());
  CHECK(out == std::vector<uint8_t>{'a', 'b'});

  file.close();
  std::remove(path.c_str());
}

TEST_CASE("file utils report missing files") {
  std::string path = temp_path("file_utils_missing.bin");
  auto size = sk1p::utils::file_size(path);
  CHECK(size.status_info.code == error_code::io_error);

  auto read = sk1p::utils::read_file(path);
  CHECK_FALSE(read.ok());
  CHECK(read.status_info.code == error_code::io_error);
  CHECK(read.status_info.message.find(path) != std::string::npos);
}
