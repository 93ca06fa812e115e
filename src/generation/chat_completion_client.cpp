#include "crimrag/generation/chat_completion_client.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"

namespace crimrag {
namespace generation {

ChatCompletionClient::ChatCompletionClient(std::shared_ptr<net::HttpClient> http_client,
                                           GenerationConfig config,
                                           std::string system_prompt)
    : http_client_(std::move(http_client)),
      config_(std::move(config)),
      system_prompt_(std::move(system_prompt)) {
    CRIMRAG_CHECK_ARGUMENT(http_client_ != nullptr, "ChatCompletionClient needs an HTTP client");
}

std::string ChatCompletionClient::generate(const std::string& prompt,
                                           std::size_t max_tokens,
                                           std::chrono::milliseconds timeout) {
    std::vector<ChatMessage> messages;
    if (!system_prompt_.empty()) {
        messages.push_back({"system", system_prompt_});
    }
    messages.push_back({"user", prompt});

    return create_chat_completion(messages, max_tokens, timeout).content;
}

ChatCompletion ChatCompletionClient::create_chat_completion(const std::vector<ChatMessage>& messages,
                                                            std::size_t max_tokens,
                                                            std::chrono::milliseconds timeout) {
    LOG_DEBUG("Creating chat completion with " + std::to_string(messages.size()) + " messages");

    net::HttpHeaders headers;
    if (!config_.service.api_key.empty()) {
        headers["Authorization"] = "Bearer " + config_.service.api_key;
    }

    net::HttpResponse response;
    try {
        response = http_client_->send_request("POST", net::join_url(config_.service.url, "chat/completions"),
                                              build_chat_completion_request(messages, max_tokens),
                                              headers, timeout);
    } catch (const net::HttpTransportError& e) {
        if (e.timed_out()) {
            throw GenerationError(GenerationErrorKind::TIMEOUT, e.what(),
                                  "ChatCompletionClient::create_chat_completion");
        }
        throw GenerationError(GenerationErrorKind::UNAVAILABLE, e.what(),
                              "ChatCompletionClient::create_chat_completion");
    }

    if (response.status == 429) {
        throw GenerationError(GenerationErrorKind::RATE_LIMITED, "generation service rate limit reached",
                              "ChatCompletionClient::create_chat_completion");
    }
    if (response.status == 408 || response.status == 504) {
        throw GenerationError(GenerationErrorKind::TIMEOUT,
                              "generation service timed out (HTTP " + std::to_string(response.status) + ")",
                              "ChatCompletionClient::create_chat_completion");
    }
    if (!response.ok()) {
        throw GenerationError(GenerationErrorKind::UNAVAILABLE,
                              "generation service returned HTTP " + std::to_string(response.status) + ": " +
                                  response.body.substr(0, 200),
                              "ChatCompletionClient::create_chat_completion");
    }

    ChatCompletion completion = parse_chat_completion_response(response.body);
    if (!completion.usage.empty()) {
        LOG_DEBUG("Chat completion usage: " + boost::json::serialize(completion.usage));
    }
    return completion;
}

std::string ChatCompletionClient::build_chat_completion_request(const std::vector<ChatMessage>& messages,
                                                                std::size_t max_tokens) const {
    boost::json::object root;

    boost::json::array messages_array;
    for (const auto& msg : messages) {
        boost::json::object message;
        message["role"] = msg.role;
        message["content"] = msg.content;
        messages_array.push_back(std::move(message));
    }
    root["messages"] = std::move(messages_array);
    root["model"] = config_.model;
    root["temperature"] = config_.temperature;
    root["max_tokens"] = max_tokens;

    return boost::json::serialize(root);
}

ChatCompletion ChatCompletionClient::parse_chat_completion_response(const std::string& response) {
    ChatCompletion completion;
    try {
        const boost::json::value val = boost::json::parse(response);
        const auto& root = val.as_object();

        if (const auto* id = root.if_contains("id"); id != nullptr && id->is_string()) {
            completion.id = std::string(id->as_string());
        }
        if (const auto* model = root.if_contains("model"); model != nullptr && model->is_string()) {
            completion.model = std::string(model->as_string());
        }
        if (const auto* usage = root.if_contains("usage"); usage != nullptr && usage->is_object()) {
            completion.usage = usage->as_object();
        }

        const auto& choices = root.at("choices").as_array();
        if (choices.empty()) {
            throw std::runtime_error("no choices in response");
        }
        const auto& choice = choices.front().as_object();
        completion.content = std::string(choice.at("message").as_object().at("content").as_string());
        if (const auto* reason = choice.if_contains("finish_reason"); reason != nullptr && reason->is_string()) {
            completion.finish_reason = std::string(reason->as_string());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse chat completion response: " + std::string(e.what()));
        throw GenerationError(GenerationErrorKind::MALFORMED,
                              std::string("invalid chat completion response: ") + e.what(),
                              "ChatCompletionClient::parse_chat_completion_response");
    }

    if (completion.content.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw GenerationError(GenerationErrorKind::MALFORMED, "chat completion returned empty content",
                              "ChatCompletionClient::parse_chat_completion_response");
    }
    return completion;
}

} // namespace generation
} // namespace crimrag
