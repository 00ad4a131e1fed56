#pragma once

// Checksum.h
//
// Deterministic signature primitives shared by the config contract and the
// telemetry/run signatures. FNV-1a 32 for parameter hashes and state digests,
// CRC-32 (IEEE, reflected 0xEDB88320) for the telemetry stream.

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace afc {
namespace checksum {

inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

inline std::uint32_t fnv1a32_text(const char* s) {
    if (!s) return 0;
    return fnv1a32_update(fnv1a32_begin(), s, std::strlen(s));
}

inline std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t len) {
    static const struct Table {
        std::uint32_t v[256];
        Table() {
            for (std::uint32_t i = 0; i < 256; ++i) {
                std::uint32_t c = i;
                for (int k = 0; k < 8; ++k) {
                    c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
                }
                v[i] = c;
            }
        }
    } table;

    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        c = table.v[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

inline std::uint32_t crc32_add_f64(std::uint32_t crc, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return crc32_update(crc, &bits, sizeof(bits));
}

inline std::uint32_t crc32_add_u32(std::uint32_t crc, std::uint32_t v) {
    return crc32_update(crc, &v, sizeof(v));
}

} // namespace checksum
} // namespace afc
