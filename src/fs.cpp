#include "treehop/fs.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <zlib.h>

namespace treehop::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_directory(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

bool is_regular_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

std::optional<std::string> read_text(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::size_t cap = data.size() * 3;
  cap = std::max<size_t>(cap, 64);
  for (int i = 0; i < 8; ++i) {
    std::vector<std::uint8_t> out(cap);
    auto destLen = static_cast<uLongf>(out.size());
    const int rc = uncompress(out.data(), &destLen, reinterpret_cast<const Bytef *>(data.data()),
                              static_cast<uLong>(data.size()));
    if (rc == Z_OK) {
      out.resize(destLen);
      return out;
    }
    if (rc == Z_BUF_ERROR) {
      cap *= 2;
      continue;
    }
    throw std::runtime_error("zlib uncompress failed");
  }
  throw std::runtime_error("zlib uncompress overflow");
}

} // namespace treehop::fs
