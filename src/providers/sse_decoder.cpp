#include "providers/sse_decoder.hpp"

#include <utility>
#include <nlohmann/json.hpp>

namespace codeloop::providers {

using core::errors::ErrorCategory;
using core::errors::LoopError;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxPreview = 200;

std::string preview(const std::string& text) {
    if (text.size() <= kMaxPreview) {
        return text;
    }
    return text.substr(0, kMaxPreview) + "...";
}

}  // namespace

core::errors::Result<std::vector<std::string>> SseDecoder::feed(
    const std::string_view bytes) {
    pending_.append(bytes.data(), bytes.size());
    return drain_lines(false);
}

core::errors::Result<std::vector<std::string>> SseDecoder::finish() {
    return drain_lines(true);
}

core::errors::Result<std::vector<std::string>> SseDecoder::drain_lines(
    const bool at_end) {
    std::vector<std::string> fragments;

    std::size_t line_start = 0;
    while (true) {
        const std::size_t newline = pending_.find('\n', line_start);
        std::string line;
        if (newline == std::string::npos) {
            if (!at_end || line_start >= pending_.size()) {
                break;
            }
            line = pending_.substr(line_start);
            line_start = pending_.size();
        } else {
            line = pending_.substr(line_start, newline - line_start);
            line_start = newline + 1;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            auto dispatched = dispatch(fragments);
            if (core::errors::is_error(dispatched)) {
                return core::errors::get_error(dispatched);
            }
            continue;
        }
        if (line.front() == ':') {
            continue;  // comment / keep-alive
        }
        if (line.rfind("data:", 0) != 0) {
            continue;  // event:, id:, retry: carry nothing we use
        }

        std::string value = line.substr(5);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
        if (has_data_) {
            data_ += "\n";
        }
        data_ += value;
        has_data_ = true;
    }
    pending_.erase(0, line_start);

    if (at_end) {
        auto dispatched = dispatch(fragments);
        if (core::errors::is_error(dispatched)) {
            return core::errors::get_error(dispatched);
        }
    }
    return fragments;
}

core::errors::Result<bool> SseDecoder::dispatch(std::vector<std::string>& fragments) {
    if (!has_data_) {
        return false;
    }
    const std::string data = std::move(data_);
    data_.clear();
    has_data_ = false;

    if (done_) {
        return false;
    }
    if (data == "[DONE]") {
        done_ = true;
        return false;
    }

    json chunk;
    try {
        chunk = json::parse(data);
    } catch (const json::parse_error& e) {
        return LoopError{ErrorCategory::Transport,
                         "Malformed stream chunk: " + preview(data),
                         "malformed_stream_chunk", e.what()};
    }

    if (chunk.contains("error")) {
        const auto& error = chunk["error"];
        std::string message = error.is_object() && error.contains("message") &&
                                      error["message"].is_string()
                                  ? error["message"].get<std::string>()
                                  : error.dump();
        return LoopError{ErrorCategory::Transport,
                         "Provider reported an error: " + message,
                         "provider_stream_error"};
    }

    if (!chunk.contains("choices") || !chunk["choices"].is_array() ||
        chunk["choices"].empty()) {
        return false;
    }
    const auto& choice = chunk["choices"][0];
    if (!choice.contains("delta") || !choice["delta"].is_object()) {
        return false;
    }
    const auto& delta = choice["delta"];
    if (!delta.contains("content") || !delta["content"].is_string()) {
        return false;
    }

    std::string content = delta["content"].get<std::string>();
    if (content.empty()) {
        return false;
    }
    fragments.push_back(std::move(content));
    return true;
}

}  // namespace codeloop::providers
