#include <gtest/gtest.h>
#include "in_memory_channel.hpp"
#include "common/base64.hpp"
#include "server/relay_session.hpp"
#include <boost/json.hpp>

using namespace livegate;
using livegate::test::InMemoryChannel;

namespace {

const std::string SETUP_COMPLETE = R"({"setupComplete":{}})";

std::string audio_message(const std::string& pcm) {
    return upstream::build_audio_input_message(pcm);
}

std::string server_audio(const std::vector<std::string>& chunks) {
    boost::json::array parts;
    for (const auto& chunk : chunks) {
        parts.push_back(boost::json::object{
            {"inlineData", boost::json::object{{"mimeType", "audio/pcm;rate=24000"},
                                               {"data", base64_encode(chunk)}}}});
    }
    boost::json::object content{{"modelTurn", boost::json::object{{"parts", std::move(parts)}}}};
    return boost::json::serialize(boost::json::object{{"serverContent", std::move(content)}});
}

std::string message_type(const std::string& text) {
    auto jv = boost::json::parse(text);
    return std::string(jv.as_object().at("type").as_string());
}

} // anonymous namespace

class RelaySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<InMemoryChannel>(ioc_.get_executor(), "client");
        upstream_ = std::make_shared<InMemoryChannel>(ioc_.get_executor(), "upstream");
    }

    void start(size_t capacity = PreReadyBuffer::kDefaultCapacity) {
        auto upstream = upstream_;
        start_with([this, upstream]() -> net::awaitable<Result<std::shared_ptr<MessageChannel>>> {
            ++connect_calls_;
            co_return std::shared_ptr<MessageChannel>(upstream);
        }, capacity);
    }

    void start_with(RelaySession::Connector connector, size_t capacity = PreReadyBuffer::kDefaultCapacity) {
        RelaySession::Options options;
        options.setup = upstream::SetupParams{"models/test-model", "Be brief."};
        options.pre_ready_capacity = capacity;

        session_ = std::make_shared<RelaySession>(ioc_.get_executor(), client_, std::move(connector), options);
        net::co_spawn(ioc_, session_->run(), [this](std::exception_ptr ep) {
            finished_ = true;
            if (ep) std::rethrow_exception(ep);
        });
        poll();
    }

    void poll() {
        ioc_.restart();
        ioc_.poll();
    }

    // Upstream messages after the setup message
    std::vector<std::string> upstream_after_setup() const {
        auto text = upstream_->sent_text();
        if (!text.empty()) text.erase(text.begin());
        return text;
    }

    net::io_context ioc_;
    std::shared_ptr<InMemoryChannel> client_;
    std::shared_ptr<InMemoryChannel> upstream_;
    std::shared_ptr<RelaySession> session_;
    int connect_calls_{0};
    bool finished_{false};
};

TEST_F(RelaySessionTest, SendsSetupOnceAfterConnect) {
    start();

    EXPECT_EQ(connect_calls_, 1);
    ASSERT_EQ(upstream_->sent_text().size(), 1u);
    auto setup = boost::json::parse(upstream_->sent_text()[0]).as_object().at("setup").as_object();
    EXPECT_EQ(setup.at("model").as_string(), "models/test-model");
    EXPECT_EQ(session_->state(), RelaySession::State::BUFFERING);
    EXPECT_FALSE(session_->is_ready());
    EXPECT_TRUE(client_->sent().empty());
}

TEST_F(RelaySessionTest, BufferedAudioFlushesInOrderBeforeLaterAudio) {
    start();

    client_->push_binary("chunk-1");
    client_->push_binary("chunk-2");
    client_->push_binary("chunk-3");
    poll();
    EXPECT_TRUE(upstream_after_setup().empty());

    upstream_->push_text(SETUP_COMPLETE);
    poll();

    ASSERT_EQ(client_->sent_text().size(), 1u);
    EXPECT_EQ(message_type(client_->sent_text()[0]), "ready");
    EXPECT_TRUE(session_->is_ready());
    EXPECT_EQ(session_->state(), RelaySession::State::RELAYING);

    client_->push_binary("chunk-4");
    poll();

    std::vector<std::string> expected{
        audio_message("chunk-1"), audio_message("chunk-2"),
        audio_message("chunk-3"), audio_message("chunk-4")};
    EXPECT_EQ(upstream_after_setup(), expected);
}

TEST_F(RelaySessionTest, AudioBeyondCapacityIsDropped) {
    start();

    for (int i = 0; i < 10; ++i) {
        client_->push_binary("chunk-" + std::to_string(i));
    }
    poll();

    EXPECT_EQ(session_->pre_ready_buffer().size(), 8u);
    EXPECT_EQ(session_->pre_ready_buffer().dropped(), 2u);
    EXPECT_FALSE(finished_);

    upstream_->push_text(SETUP_COMPLETE);
    poll();

    auto forwarded = upstream_after_setup();
    ASSERT_EQ(forwarded.size(), 8u);
    EXPECT_EQ(forwarded.front(), audio_message("chunk-0"));
    EXPECT_EQ(forwarded.back(), audio_message("chunk-7"));
}

TEST_F(RelaySessionTest, RepeatedSetupCompleteDoesNotRedrain) {
    start();

    client_->push_binary("a");
    client_->push_binary("b");
    upstream_->push_text(SETUP_COMPLETE);
    poll();
    upstream_->push_text(SETUP_COMPLETE);
    poll();

    EXPECT_EQ(client_->sent_text().size(), 1u);
    EXPECT_EQ(upstream_after_setup().size(), 2u);
}

TEST_F(RelaySessionTest, SetupCompleteWithoutContentStillCounts) {
    start();

    upstream_->push_text(R"({"setupComplete":null})");
    poll();

    EXPECT_TRUE(session_->is_ready());
}

TEST_F(RelaySessionTest, InlineAudioIsForwardedAsBinary) {
    start();
    upstream_->push_text(SETUP_COMPLETE);
    poll();

    std::string first("\x01\x00\x02\xff", 4);
    std::string second("\x10\x20", 2);
    upstream_->push_text(server_audio({first, second}));
    poll();

    auto binary = client_->sent_binary();
    ASSERT_EQ(binary.size(), 2u);
    EXPECT_EQ(binary[0], first);
    EXPECT_EQ(binary[1], second);
}

TEST_F(RelaySessionTest, SnakeCaseInlineDataIsAccepted) {
    start();

    upstream_->push_text(
        R"({"serverContent":{"modelTurn":{"parts":[{"inline_data":{"data":"aGVsbG8="}}]}}})");
    poll();

    auto binary = client_->sent_binary();
    ASSERT_EQ(binary.size(), 1u);
    EXPECT_EQ(binary[0], "hello");
}

TEST_F(RelaySessionTest, UndecodableAudioPartIsSkipped) {
    start();

    upstream_->push_text(
        R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"data":"!!!"}},{"inlineData":{"data":"aGk="}}]}}})");
    poll();

    auto binary = client_->sent_binary();
    ASSERT_EQ(binary.size(), 1u);
    EXPECT_EQ(binary[0], "hi");
    EXPECT_FALSE(finished_);
}

TEST_F(RelaySessionTest, TurnCompleteForwardedOnce) {
    start();

    upstream_->push_text(R"({"serverContent":{"turnComplete":true}})");
    poll();

    ASSERT_EQ(client_->sent_text().size(), 1u);
    EXPECT_EQ(client_->sent_text()[0], R"({"type":"turn_complete"})");
}

TEST_F(RelaySessionTest, InterruptedForwarded) {
    start();

    upstream_->push_text(R"({"serverContent":{"interrupted":true}})");
    poll();

    ASSERT_EQ(client_->sent_text().size(), 1u);
    EXPECT_EQ(message_type(client_->sent_text()[0]), "interrupted");
}

TEST_F(RelaySessionTest, MessageOrderWithinOneUpstreamMessage) {
    start();

    upstream_->push_text(
        R"({"serverContent":{"interrupted":true,"modelTurn":{"parts":[{"inlineData":{"data":"aGk="}}]},"turnComplete":true}})");
    poll();

    const auto& sent = client_->sent();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(message_type(sent[0].data), "interrupted");
    EXPECT_TRUE(sent[1].is_binary());
    EXPECT_EQ(message_type(sent[2].data), "turn_complete");
}

TEST_F(RelaySessionTest, UpstreamErrorForwardedWithDetails) {
    start();

    upstream_->push_text(R"({"error":{"code":400,"message":"bad model"}})");
    poll();

    ASSERT_EQ(client_->sent_text().size(), 1u);
    auto obj = boost::json::parse(client_->sent_text()[0]).as_object();
    EXPECT_EQ(obj.at("type").as_string(), "error");
    EXPECT_EQ(obj.at("details").as_object().at("code").as_int64(), 400);
    EXPECT_FALSE(finished_);
}

TEST_F(RelaySessionTest, RpcStatusTreatedAsError) {
    start();

    upstream_->push_text(R"({"rpcStatus":{"code":7}})");
    poll();

    ASSERT_EQ(client_->sent_text().size(), 1u);
    EXPECT_EQ(message_type(client_->sent_text()[0]), "error");
}

TEST_F(RelaySessionTest, MalformedTextIsIgnored) {
    start();

    client_->push_text("not json");
    client_->push_text(R"({"type":"unknown"})");
    upstream_->push_text("{{{");
    upstream_->push_binary(std::string("\x00\x01", 2));
    poll();

    EXPECT_FALSE(finished_);
    EXPECT_TRUE(client_->sent().empty());
    EXPECT_TRUE(upstream_after_setup().empty());
    EXPECT_FALSE(client_->closed());
    EXPECT_FALSE(upstream_->closed());
}

TEST_F(RelaySessionTest, StopSendsStreamEndAndEndsSession) {
    start();
    upstream_->push_text(SETUP_COMPLETE);
    poll();

    client_->push_text(R"({"type":"stop"})");
    poll();

    auto forwarded = upstream_after_setup();
    ASSERT_EQ(forwarded.size(), 1u);
    EXPECT_EQ(forwarded[0], R"({"realtimeInput":{"audioStreamEnd":true}})");

    EXPECT_TRUE(finished_);
    EXPECT_EQ(session_->state(), RelaySession::State::CLOSED);
    EXPECT_TRUE(upstream_->closed());
    EXPECT_TRUE(client_->closed());
}

TEST_F(RelaySessionTest, ClientDisconnectClosesBothLegs) {
    start();

    client_->peer_close();
    poll();

    EXPECT_TRUE(finished_);
    EXPECT_EQ(upstream_->close_calls(), 1);
    EXPECT_EQ(client_->close_calls(), 1);
    EXPECT_EQ(session_->state(), RelaySession::State::CLOSED);
}

TEST_F(RelaySessionTest, UpstreamCloseClosesBothLegs) {
    start();

    upstream_->peer_close();
    poll();

    EXPECT_TRUE(finished_);
    EXPECT_TRUE(upstream_->closed());
    EXPECT_TRUE(client_->closed());
}

TEST_F(RelaySessionTest, ConnectFailureSendsOneErrorAndCloses) {
    start_with([this]() -> net::awaitable<Result<std::shared_ptr<MessageChannel>>> {
        ++connect_calls_;
        co_return make_error(ErrorCode::CONNECT_ERROR, "Upstream connection failed: refused");
    });

    EXPECT_TRUE(finished_);
    ASSERT_EQ(client_->sent().size(), 1u);
    auto obj = boost::json::parse(client_->sent()[0].data).as_object();
    EXPECT_EQ(obj.at("type").as_string(), "error");
    EXPECT_EQ(obj.at("message").as_string(), "Upstream connection failed: refused");
    EXPECT_TRUE(client_->closed());
    EXPECT_TRUE(upstream_->sent().empty());
    EXPECT_EQ(session_->state(), RelaySession::State::CLOSED);
}

TEST_F(RelaySessionTest, ApiKeyModeRefusedBeforeConnecting) {
    start_with([]() -> net::awaitable<Result<std::shared_ptr<MessageChannel>>> {
        co_return make_error(ErrorCode::CONFIGURATION_ERROR,
                             "API keys are not supported for the Live API WebSocket. Use OAuth2.");
    });

    ASSERT_EQ(client_->sent_text().size(), 1u);
    EXPECT_EQ(message_type(client_->sent_text()[0]), "error");
    EXPECT_TRUE(client_->closed());
}
