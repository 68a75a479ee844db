#include "parser/tag_grammar.hpp"

#include <cctype>
#include <utility>

namespace codeloop::parser {

using protocol::ActionSegment;
using protocol::FinalSegment;

namespace {

constexpr const char* kThoughtsTag = "thoughts";
constexpr const char* kActionTag = "py-script";
constexpr const char* kFinalTag = "finalResponse";
constexpr const char* kCommitAttribute = "commit";

struct TagBlock {
    std::string attributes;
    std::string inner;
    std::string raw;
};

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_attribute_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '-' || c == ':' || c == '.';
}

// Equivalent to the first match of /<tag[^>]*>([\s\S]*?)<\/tag>/ with the
// extra rule that the tag name must end at whitespace, '/' or '>'.
std::optional<TagBlock> find_first_block(const std::string& buffer,
                                         const std::string& tag) {
    const std::string open_prefix = "<" + tag;
    const std::string close_tag = "</" + tag + ">";

    std::size_t search_from = 0;
    while (true) {
        const std::size_t open = buffer.find(open_prefix, search_from);
        if (open == std::string::npos) {
            return std::nullopt;
        }

        const std::size_t name_end = open + open_prefix.size();
        if (name_end >= buffer.size()) {
            return std::nullopt;
        }
        const char next = buffer[name_end];
        if (next != '>' && next != '/' && !is_space(next)) {
            search_from = open + 1;
            continue;
        }

        const std::size_t open_end = buffer.find('>', name_end);
        if (open_end == std::string::npos) {
            return std::nullopt;
        }

        // A later opening tag could only close at or after this position too.
        const std::size_t close = buffer.find(close_tag, open_end + 1);
        if (close == std::string::npos) {
            return std::nullopt;
        }

        TagBlock block;
        block.attributes = buffer.substr(name_end, open_end - name_end);
        block.inner = buffer.substr(open_end + 1, close - open_end - 1);
        block.raw = buffer.substr(open, close + close_tag.size() - open);
        return block;
    }
}

}  // namespace

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    while (begin < value.size() && is_space(value[begin])) {
        ++begin;
    }
    std::size_t end = value.size();
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string strip_code_fence(const std::string& code) {
    std::string stripped = trim(code);
    if (stripped.rfind("```", 0) != 0) {
        return stripped;
    }

    std::size_t tag_end = 3;
    while (tag_end < stripped.size() &&
           (std::isalnum(static_cast<unsigned char>(stripped[tag_end])) != 0 ||
            stripped[tag_end] == '_' || stripped[tag_end] == '+' ||
            stripped[tag_end] == '-')) {
        ++tag_end;
    }
    // A language tag is a word on the fence line; ```print(1)``` has none.
    std::size_t body_start = 3;
    if (tag_end == stripped.size() || is_space(stripped[tag_end])) {
        body_start = tag_end;
    }

    std::size_t body_end = stripped.size();
    if (body_end >= body_start + 3 &&
        stripped.compare(body_end - 3, 3, "```") == 0) {
        body_end -= 3;
    }
    return trim(stripped.substr(body_start, body_end - body_start));
}

std::unordered_map<std::string, std::string> parse_attributes(const std::string& text) {
    std::unordered_map<std::string, std::string> attributes;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_attribute_name_char(text[i])) {
            ++i;
            continue;
        }

        const std::size_t name_start = i;
        while (i < text.size() && is_attribute_name_char(text[i])) {
            ++i;
        }
        const std::string name = text.substr(name_start, i - name_start);

        std::size_t cursor = i;
        while (cursor < text.size() && is_space(text[cursor])) {
            ++cursor;
        }
        if (cursor >= text.size() || text[cursor] != '=') {
            continue;
        }
        ++cursor;
        while (cursor < text.size() && is_space(text[cursor])) {
            ++cursor;
        }
        if (cursor >= text.size() || (text[cursor] != '"' && text[cursor] != '\'')) {
            i = cursor;
            continue;
        }

        const char quote = text[cursor];
        const std::size_t value_start = cursor + 1;
        const std::size_t value_end = text.find(quote, value_start);
        if (value_end == std::string::npos) {
            break;
        }

        // First occurrence wins, matching how the first complete tag wins.
        attributes.emplace(name, text.substr(value_start, value_end - value_start));
        i = value_end + 1;
    }
    return attributes;
}

std::vector<std::string> parse_commit_ids(const std::string& value) {
    std::vector<std::string> ids;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string id = trim(value.substr(start, comma - start));
        if (!id.empty()) {
            ids.push_back(std::move(id));
        }
        start = comma + 1;
    }
    return ids;
}

std::optional<std::string> extract_thoughts(const std::string& buffer) {
    auto block = find_first_block(buffer, kThoughtsTag);
    if (!block) {
        return std::nullopt;
    }
    return trim(block->inner);
}

std::optional<std::string> extract_thoughts_block(const std::string& buffer) {
    auto block = find_first_block(buffer, kThoughtsTag);
    if (!block) {
        return std::nullopt;
    }
    return std::move(block->raw);
}

std::optional<ActionSegment> extract_action(const std::string& buffer,
                                            const std::string& round_id) {
    auto block = find_first_block(buffer, kActionTag);
    if (!block) {
        return std::nullopt;
    }

    ActionSegment action;
    action.id = round_id;
    action.code = strip_code_fence(block->inner);
    action.raw = block->raw;

    const auto attributes = parse_attributes(block->attributes);
    const auto id_it = attributes.find("id");
    if (id_it != attributes.end()) {
        action.tag_id = id_it->second;
    }
    return action;
}

std::optional<FinalSegment> extract_final(const std::string& buffer) {
    auto block = find_first_block(buffer, kFinalTag);
    if (!block) {
        return std::nullopt;
    }

    FinalSegment final_segment;
    final_segment.content = trim(block->inner);
    final_segment.attributes = parse_attributes(block->attributes);

    const auto commit_it = final_segment.attributes.find(kCommitAttribute);
    if (commit_it != final_segment.attributes.end()) {
        final_segment.commit_ids = parse_commit_ids(commit_it->second);
    }
    return final_segment;
}

}  // namespace codeloop::parser
