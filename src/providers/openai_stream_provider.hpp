#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "providers/completion_provider.hpp"

namespace codeloop::providers {

struct ProviderSettings {
    std::string base_url = "http://localhost:11434/v1/";
    std::string api_key = "ollama";
    long connect_timeout_s = 20;
    long request_timeout_s = 0;  // 0 = no overall limit; streams can run long
};

// {model, messages, temperature, stream: true}
nlohmann::json build_request_body(const CompletionRequest& request);

// The POST payload. Invalid UTF-8 in message text becomes U+FFFD instead of throwing.
std::string serialize_request_body(const CompletionRequest& request);

// "<base>/chat/completions", tolerating a base URL with or without a trailing slash.
std::string chat_completions_url(const std::string& base_url);

// OpenAI-compatible chat-completions endpoint streamed over libcurl.
class OpenAiStreamProvider : public CompletionProvider {
public:
    explicit OpenAiStreamProvider(ProviderSettings settings);

    core::errors::Result<StreamStatus> stream(
        const CompletionRequest& request, const FragmentSink& on_fragment,
        const core::cancellation::CancelToken& cancel_token) override;

private:
    ProviderSettings settings_;
};

}  // namespace codeloop::providers
