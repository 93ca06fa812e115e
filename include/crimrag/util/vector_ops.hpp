#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace crimrag {
namespace util {

// Cosine similarity in [-1, 1]. Returns 0 for empty, mismatched or zero vectors.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// In-place L2 normalization. Zero vectors are left untouched.
void l2_normalize(std::vector<float>& v);

// 64-bit FNV-1a. Stable across platforms and runs.
uint64_t fnv1a_64(std::string_view data, uint64_t seed = 14695981039346656037ULL);

// Deterministic RFC 4122 style UUID string derived from `key`.
std::string uuid_from_key(std::string_view key);

} // namespace util
} // namespace crimrag
