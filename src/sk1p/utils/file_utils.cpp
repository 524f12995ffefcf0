#include "file_utils.hpp"
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace sk1p::utils {

engine::result<uint64_t> file_size(const std::string& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return engine::error_result<uint64_t>(engine::error_code::io_error, path + ": " + ec.message());
  }
  return engine::ok_result(static_cast<uint64_t>(size));
}

engine::status read_range(std::ifstream& file, uint64_t offset, size_t size, std::vector<uint8_t>& out) {
  out.resize(size);
  file.clear();
  file.seekg(static_cast<std::streamoff>(offset));
  file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
  if (static_cast<size_t>(file.gcount()) != size) {
    return engine::make_status(
        engine::error_code::io_error,
        "short read at offset " + std::to_string(offset) + ": wanted " + std::to_string(size) + ", got " +
            std::to_string(file.gcount())
    );
  }
  return engine::ok_status();
}

engine::result<std::vector<uint8_t>> read_file(const std::string& path) {
  auto size = file_size(path);
  if (!size.ok()) {
    return engine::error_result<std::vector<uint8_t>>(size.status_info.code, size.status_info.message);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return engine::error_result<std::vector<uint8_t>>(engine::error_code::io_error, "could not open file: " + path);
  }

  std::vector<uint8_t> data;
  auto read = read_range(file, 0, static_cast<size_t>(size.value), data);
  if (!read.ok()) {
    return engine::error_result<std::vector<uint8_t>>(read.code, path + ": " + read.message);
  }
  return engine::ok_result(std::move(data));
}

bool write_file(const std::string& path, std::span<const uint8_t> data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  return file.good();
}

} // namespace sk1p::utils
