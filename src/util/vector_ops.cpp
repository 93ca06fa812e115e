#include "crimrag/util/vector_ops.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace crimrag {
namespace util {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

void l2_normalize(std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    if (sum <= 0.0) {
        return;
    }
    const double inv = 1.0 / std::sqrt(sum);
    for (float& x : v) {
        x = static_cast<float>(x * inv);
    }
}

uint64_t fnv1a_64(std::string_view data, uint64_t seed) {
    uint64_t hash = seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string uuid_from_key(std::string_view key) {
    const uint64_t hi = fnv1a_64(key);
    const uint64_t lo = fnv1a_64(key, hi ^ 0x9e3779b97f4a7c15ULL);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xffff),
                  static_cast<unsigned>((hi & 0x0fff) | 0x5000),
                  static_cast<unsigned>(((lo >> 48) & 0x3fff) | 0x8000),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return std::string(buffer);
}

} // namespace util
} // namespace crimrag
