#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/loop_errors.hpp"
#include "providers/openai_stream_provider.hpp"

namespace {

using codeloop::core::errors::ErrorCategory;
using codeloop::core::errors::get_error;
using codeloop::core::errors::is_error;
using codeloop::protocol::Role;
using codeloop::providers::build_request_body;
using codeloop::providers::chat_completions_url;
using codeloop::providers::CompletionRequest;
using codeloop::providers::OpenAiStreamProvider;
using codeloop::providers::ProviderSettings;
using codeloop::providers::serialize_request_body;

TEST(OpenAiStreamProviderTest, JoinsChatCompletionsPath) {
    EXPECT_EQ(chat_completions_url("http://localhost:11434/v1/"),
              "http://localhost:11434/v1/chat/completions");
    EXPECT_EQ(chat_completions_url("https://api.example.com/v1"),
              "https://api.example.com/v1/chat/completions");
}

TEST(OpenAiStreamProviderTest, RequestBodyAlwaysStreams) {
    CompletionRequest request;
    request.model = "llama3.1:latest";
    request.temperature = 0.3;
    request.messages.push_back({Role::System, "rules", std::nullopt});
    request.messages.push_back({Role::Tool, "2", std::string("call-1")});

    const auto body = build_request_body(request);
    EXPECT_EQ(body.at("model"), "llama3.1:latest");
    EXPECT_DOUBLE_EQ(body.at("temperature").get<double>(), 0.3);
    EXPECT_TRUE(body.at("stream").get<bool>());
    ASSERT_EQ(body.at("messages").size(), 2u);
    EXPECT_EQ(body.at("messages")[0].at("role"), "system");
    EXPECT_FALSE(body.at("messages")[0].contains("tool_call_id"));
    EXPECT_EQ(body.at("messages")[1].at("role"), "tool");
    EXPECT_EQ(body.at("messages")[1].at("tool_call_id"), "call-1");
}

TEST(OpenAiStreamProviderTest, SerializedBodyToleratesInvalidUtf8) {
    CompletionRequest request;
    request.model = "any";
    request.messages.push_back({Role::User, "<observation>\n\xFF\n</observation>", std::nullopt});

    std::string body;
    EXPECT_NO_THROW(body = serialize_request_body(request));
    EXPECT_NE(body.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(body.find("\"stream\":true"), std::string::npos);
}

TEST(OpenAiStreamProviderTest, UnreachableEndpointIsTransportError) {
    ProviderSettings settings;
    settings.base_url = "http://127.0.0.1:1/v1";
    settings.connect_timeout_s = 2;
    OpenAiStreamProvider provider(settings);

    CompletionRequest request;
    request.model = "any";
    request.messages.push_back({Role::User, "hi", std::nullopt});

    bool received = false;
    auto result = provider.stream(
        request,
        [&received](const std::string&) {
            received = true;
            return true;
        },
        codeloop::core::cancellation::make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "transport_failed");
    EXPECT_FALSE(received);
}

}  // namespace
