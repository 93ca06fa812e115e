#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace crimrag {
namespace generation {

class GenerationClient {
public:
    virtual ~GenerationClient() = default;

    // Single attempt. Throws GenerationError; retrying is the caller's job.
    virtual std::string generate(const std::string& prompt,
                                 std::size_t max_tokens,
                                 std::chrono::milliseconds timeout) = 0;
};

} // namespace generation
} // namespace crimrag
