#pragma once

#include <cstddef>
#include <string>

namespace offload {

// Default read size for content hashing
constexpr size_t DEFAULT_HASH_CHUNK_BYTES = 8192;

/**
 * Streaming BLAKE3 content hash of a file, read in fixed-size chunks.
 *
 * @return Lowercase hex digest, or an empty string if the file cannot be read.
 *         Callers treat an empty digest as "unknown", never as equal to another.
 */
std::string HashFileContents(const std::string& path, size_t chunk_bytes = DEFAULT_HASH_CHUNK_BYTES);

} // namespace offload
