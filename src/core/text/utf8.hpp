#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace codeloop::core::text {

    // Copy of `input` in which every byte that does not start a well-formed
    // UTF-8 sequence (overlongs, surrogates and > U+10FFFF included) is
    // replaced by U+FFFD.
    inline std::string sanitize_utf8(std::string_view input) {
        constexpr const char* kReplacement = "\xEF\xBF\xBD";

        std::string out;
        out.reserve(input.size());
        std::size_t i = 0;
        while (i < input.size()) {
            const auto lead = static_cast<unsigned char>(input[i]);
            std::size_t length = 0;
            unsigned char min_second = 0x80;
            unsigned char max_second = 0xBF;

            if (lead < 0x80) {
                length = 1;
            } else if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                if (lead == 0xE0) min_second = 0xA0;
                if (lead == 0xED) max_second = 0x9F;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                if (lead == 0xF0) min_second = 0x90;
                if (lead == 0xF4) max_second = 0x8F;
            }

            bool valid = length > 0 && i + length <= input.size();
            for (std::size_t k = 1; valid && k < length; ++k) {
                const auto byte = static_cast<unsigned char>(input[i + k]);
                const unsigned char low = k == 1 ? min_second : 0x80;
                const unsigned char high = k == 1 ? max_second : 0xBF;
                valid = byte >= low && byte <= high;
            }

            if (valid) {
                out.append(input.data() + i, length);
                i += length;
            } else {
                out += kReplacement;
                ++i;
            }
        }
        return out;
    }

} // namespace codeloop::core::text
