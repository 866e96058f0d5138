#include "FileHasher.h"

#include <blake3.h>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace offload {

std::string HashFileContents(const std::string& path, size_t chunk_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    if (chunk_bytes == 0) {
        chunk_bytes = DEFAULT_HASH_CHUNK_BYTES;
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);

    std::vector<char> buffer(chunk_bytes);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        return "";
    }

    uint8_t digest[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, digest, BLAKE3_OUT_LEN);

    std::ostringstream hex;
    for (uint8_t b : digest) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return hex.str();
}

} // namespace offload
