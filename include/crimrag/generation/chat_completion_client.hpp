#pragma once

#include "crimrag/config.hpp"
#include "crimrag/generation/generation_client.hpp"
#include "crimrag/net/http_client.hpp"

#include <boost/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace crimrag {
namespace generation {

struct ChatMessage {
    std::string role;  // "system", "user", "assistant"
    std::string content;
};

struct ChatCompletion {
    std::string id;
    std::string model;
    std::string content;
    std::string finish_reason;
    boost::json::object usage;
};

/**
 * OpenAI-compatible /chat/completions client (Groq, vLLM, llama.cpp
 * server...). Sends the system prompt followed by the user prompt.
 *
 * HTTP 429 maps to RATE_LIMITED, 408/504 and transport timeouts to
 * TIMEOUT, unparseable or empty bodies to MALFORMED, everything else to
 * UNAVAILABLE.
 */
class ChatCompletionClient : public GenerationClient {
public:
    ChatCompletionClient(std::shared_ptr<net::HttpClient> http_client,
                         GenerationConfig config,
                         std::string system_prompt);

    std::string generate(const std::string& prompt,
                         std::size_t max_tokens,
                         std::chrono::milliseconds timeout) override;

    ChatCompletion create_chat_completion(const std::vector<ChatMessage>& messages,
                                          std::size_t max_tokens,
                                          std::chrono::milliseconds timeout);

private:
    std::string build_chat_completion_request(const std::vector<ChatMessage>& messages,
                                              std::size_t max_tokens) const;
    static ChatCompletion parse_chat_completion_response(const std::string& response);

    std::shared_ptr<net::HttpClient> http_client_;
    GenerationConfig config_;
    std::string system_prompt_;
};

} // namespace generation
} // namespace crimrag
