#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace codeloop::parser {

// All extractors scan the whole buffer, never throw, and return nullopt until
// both the opening and the closing tag have arrived. Calling them again on a
// longer prefix of the same stream is always safe.

// Inner text of the first complete <thoughts> block, trimmed.
std::optional<std::string> extract_thoughts(const std::string& buffer);

// The first complete <thoughts> block as written, tags included.
std::optional<std::string> extract_thoughts_block(const std::string& buffer);

// First complete <py-script ...> block, identified by the round it arrived in.
// The tag's own id attribute only lands in `tag_id`.
std::optional<protocol::ActionSegment> extract_action(const std::string& buffer,
                                                      const std::string& round_id);

// First complete <finalResponse ...> block, with its attributes and the
// parsed commit list.
std::optional<protocol::FinalSegment> extract_final(const std::string& buffer);

// Permissive key="value" scan; unparseable text between pairs is skipped.
std::unordered_map<std::string, std::string> parse_attributes(const std::string& text);

// "a,b, c" -> {"a","b","c"}; empty entries are dropped.
std::vector<std::string> parse_commit_ids(const std::string& value);

std::string trim(const std::string& value);

// Removes a Markdown fence wrapping the whole script (```python ... ```).
std::string strip_code_fence(const std::string& code);

}  // namespace codeloop::parser
