#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace collagist::util {

// FNV-1a over every byte. Used to fingerprint rendered canvases.
inline size_t fnv1a(const uint8_t* data, size_t len) {
    size_t hash = 14695981039346656037ULL;  // FNV offset basis
    for (size_t i = 0; i < len; ++i) {
        hash ^= data[i];
        hash *= 1099511628211ULL;  // FNV prime
    }
    return hash;
}

inline size_t fnv1a(const std::vector<uint8_t>& data) {
    return fnv1a(data.data(), data.size());
}

}  // namespace collagist::util
