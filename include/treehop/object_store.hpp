#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treehop {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Read-only access to loose objects under <common_dir>/objects.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir)
    : objects_dir_(std::move(objects_dir)) {}

  // Inflate and verify the loose object `hex_oid`.
  // std::nullopt if there is no loose file (the object may be packed);
  // throws GitRepositoryError if the file is corrupt or hashes to another id.
  std::optional<Object> read(std::string_view hex_oid) const;

  std::filesystem::path path_for(std::string_view hex_oid) const;

private:
  std::filesystem::path objects_dir_;
};

} // namespace treehop
