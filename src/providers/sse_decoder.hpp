#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "core/errors/loop_errors.hpp"

namespace codeloop::providers {

// Incremental decoder for an OpenAI-style chat-completions event stream.
// Bytes may be split anywhere; every complete event yields at most one text
// fragment taken from choices[0].delta.content.
class SseDecoder {
public:
    core::errors::Result<std::vector<std::string>> feed(std::string_view bytes);

    // Flushes an event left open by a stream that ended without a blank line.
    core::errors::Result<std::vector<std::string>> finish();

    bool done() const { return done_; }

private:
    core::errors::Result<std::vector<std::string>> drain_lines(bool at_end);
    core::errors::Result<bool> dispatch(std::vector<std::string>& fragments);

    std::string pending_;
    std::string data_;
    bool has_data_ = false;
    bool done_ = false;
};

}  // namespace codeloop::providers
