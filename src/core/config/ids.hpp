#pragma once
#include <chrono>
#include <random>
#include <sstream>
#include <string>

namespace codeloop::core::config {

    namespace detail {
        constexpr char kBase36Digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

        inline std::string to_base36(unsigned long long value) {
            std::string out;
            do {
                out.insert(out.begin(), kBase36Digits[value % 36]);
                value /= 36;
            } while (value != 0);
            return out;
        }
    } // namespace detail

    // Generates a simple 8-character hex ID prefixed with "sess-"
    inline std::string generate_session_id() {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "sess-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Opaque round id: base36 millisecond clock followed by 10 random base36
    // characters, so two rounds started in the same millisecond still differ.
    inline std::string generate_round_id() {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();

        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 35);

        std::string id = detail::to_base36(static_cast<unsigned long long>(ms));
        for (int i = 0; i < 10; ++i) {
            id.push_back(detail::kBase36Digits[dis(gen)]);
        }
        return id;
    }

} // namespace codeloop::core::config
