#include "providers/openai_stream_provider.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>
#include <curl/curl.h>
#include "core/logging/logger.hpp"
#include "providers/sse_decoder.hpp"

namespace codeloop::providers {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxErrorBody = 4096;

struct TransferState {
    CURL* curl = nullptr;
    SseDecoder decoder;
    const FragmentSink* sink = nullptr;
    core::cancellation::CancelToken cancel_token;
    bool stopped_by_sink = false;
    bool cancelled = false;
    std::optional<LoopError> error;
    std::string error_body;
};

long response_code(CURL* curl) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

// Returns false once the sink asks to stop.
bool deliver(TransferState& state, const std::vector<std::string>& fragments) {
    for (const auto& fragment : fragments) {
        if (!(*state.sink)(fragment)) {
            state.stopped_by_sink = true;
            return false;
        }
    }
    return true;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    const size_t total = size * nmemb;

    if (response_code(state->curl) >= 400) {
        if (state->error_body.size() < kMaxErrorBody) {
            state->error_body.append(ptr, std::min(total, kMaxErrorBody - state->error_body.size()));
        }
        return total;
    }

    auto decoded = state->decoder.feed(std::string_view(ptr, total));
    if (core::errors::is_error(decoded)) {
        state->error = core::errors::get_error(decoded);
        return 0;
    }
    if (!deliver(*state, core::errors::get_value(decoded))) {
        return 0;
    }
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(clientp);
    if (core::cancellation::is_cancelled(state->cancel_token)) {
        state->cancelled = true;
        return 1;
    }
    return 0;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

json build_request_body(const CompletionRequest& request) {
    json messages = json::array();
    for (const auto& message : request.messages) {
        json entry;
        entry["role"] = protocol::to_string(message.role);
        entry["content"] = message.content;
        if (message.tool_call_id.has_value()) {
            entry["tool_call_id"] = message.tool_call_id.value();
        }
        messages.push_back(std::move(entry));
    }

    json body;
    body["model"] = request.model;
    body["messages"] = std::move(messages);
    body["temperature"] = request.temperature;
    body["stream"] = true;
    return body;
}

std::string serialize_request_body(const CompletionRequest& request) {
    return build_request_body(request).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string chat_completions_url(const std::string& base_url) {
    if (!base_url.empty() && base_url.back() == '/') {
        return base_url + "chat/completions";
    }
    return base_url + "/chat/completions";
}

OpenAiStreamProvider::OpenAiStreamProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {
    ensure_curl_global_init();
}

core::errors::Result<StreamStatus> OpenAiStreamProvider::stream(
    const CompletionRequest& request, const FragmentSink& on_fragment,
    const core::cancellation::CancelToken& cancel_token) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return LoopError{ErrorCategory::Transport,
                         "Failed to initialize HTTP client (cURL).",
                         "curl_init_failed"};
    }

    const std::string url = chat_completions_url(settings_.base_url);
    const std::string body = serialize_request_body(request);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: text/event-stream");
    if (!settings_.api_key.empty()) {
        const std::string auth_header = "Authorization: Bearer " + settings_.api_key;
        headers = curl_slist_append(headers, auth_header.c_str());
    }

    TransferState state;
    state.curl = curl;
    state.sink = &on_fragment;
    state.cancel_token = cancel_token;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, settings_.connect_timeout_s);
    if (settings_.request_timeout_s > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings_.request_timeout_s);
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

    LOG_DEBUG("OpenAiStreamProvider: POST " + url + " (" +
              std::to_string(request.messages.size()) + " messages)");
    const CURLcode res = curl_easy_perform(curl);
    const long http_code = response_code(curl);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (state.stopped_by_sink || state.cancelled) {
        return StreamStatus::Stopped;
    }
    if (state.error.has_value()) {
        return state.error.value();
    }
    if (res != CURLE_OK) {
        return LoopError{ErrorCategory::Transport,
                         std::string("Streaming request failed: ") + curl_easy_strerror(res),
                         "transport_failed",
                         "Check that the completion endpoint is reachable: " + url};
    }
    if (http_code >= 400) {
        return LoopError{ErrorCategory::Transport,
                         "Completion endpoint returned HTTP " + std::to_string(http_code) +
                             ": " + state.error_body,
                         "http_error"};
    }

    auto tail = state.decoder.finish();
    if (core::errors::is_error(tail)) {
        return core::errors::get_error(tail);
    }
    if (!deliver(state, core::errors::get_value(tail))) {
        return StreamStatus::Stopped;
    }
    return StreamStatus::Completed;
}

}  // namespace codeloop::providers
