#include "treehop/object_store.hpp"

#include "treehop/consts.hpp"
#include "treehop/errors.hpp"
#include "treehop/fs.hpp"
#include "treehop/hash.hpp"
#include "treehop/util.hpp"

#include <algorithm>

namespace treehop {

std::filesystem::path ObjectStore::path_for(std::string_view hex_oid) const {
  const std::string hex = strutil::to_lower(hex_oid);
  return objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

std::optional<Object> ObjectStore::read(std::string_view hex_oid) const {
  oid expected{};
  if (!from_hex(hex_oid, expected))
    throw GitRepositoryError(objects_dir_, "bad object id '" + std::string(hex_oid) + "'");

  const auto path = path_for(hex_oid);
  if (!fs::is_regular_file(path))
    return std::nullopt;

  std::vector<std::uint8_t> store;
  try {
    store = fs::z_decompress(fs::read_file(path));
  } catch (const std::runtime_error &e) {
    throw GitRepositoryError(path, std::string("cannot inflate object: ") + e.what());
  }
  if (sha1(store) != expected)
    throw GitRepositoryError(path, "object hash mismatch (corrupt object)");

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  auto it_nul = std::find(it_space, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_space == store.end() || it_nul == store.end())
    throw GitRepositoryError(path, "invalid object header");

  std::string type(store.begin(), it_space);
  const auto payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

} // namespace treehop
