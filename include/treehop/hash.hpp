#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace treehop {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * A loose object's id is the SHA-1 of its inflated contents, i.e. the
 *   "<type> <size>\\0" header followed by the payload.
 */
oid sha1(std::span<const std::uint8_t> data);

/**
 * Parse 40-char hex (either case) into a binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

// Cheap check used before treating ref contents as an object id.
bool looks_hex40(std::string_view str);

} // namespace treehop
