#include <gtest/gtest.h>
#include "chessscribe/encoding.h"
#include "chessscribe/error.h"
#include "chessscribe/recognition.h"

#include <nlohmann/json.hpp>

#include <vector>

using namespace ChessScribe;

static RecognitionConfig MakeConfig(double min_delay, double max_delay) {
    RecognitionConfig cfg;
    cfg.enabled     = true;
    cfg.min_delay_s = min_delay;
    cfg.max_delay_s = max_delay;
    cfg.seed        = 42;
    return cfg;
}

static cv::Mat MakeBoard() { return cv::Mat(16, 16, CV_8UC3, cv::Scalar(200, 200, 200)); }

TEST(Recognition, DelaysStayWithinBounds) {
    std::vector<std::chrono::milliseconds> waits;
    int calls = 0;
    RecognitionClient client(
        MakeConfig(1.0, 5.0),
        [&](const cv::Mat&) {
            ++calls;
            return RecognitionResult{"8/8/8/8/8/8/8/8", "w"};
        },
        [&](std::chrono::milliseconds d) { waits.push_back(d); });

    for (int i = 0; i < 50; ++i) { ASSERT_TRUE(client.Recognize(MakeBoard()).has_value()); }

    ASSERT_EQ(waits.size(), 50u);
    EXPECT_EQ(calls, 50);
    for (auto w : waits) {
        EXPECT_GE(w.count(), 1000);
        EXPECT_LE(w.count(), 5000);
    }
}

TEST(Recognition, FixedDelay) {
    std::vector<std::chrono::milliseconds> waits;
    RecognitionClient client(
        MakeConfig(0.25, 0.25), [](const cv::Mat&) { return RecognitionResult{"8/8/8/8/8/8/8/8", ""}; },
        [&](std::chrono::milliseconds d) { waits.push_back(d); });

    client.Recognize(MakeBoard());
    ASSERT_EQ(waits.size(), 1u);
    EXPECT_EQ(waits[0].count(), 250);
}

TEST(Recognition, FailureAffectsOnlyThatCall) {
    int calls = 0;
    RecognitionClient client(
        MakeConfig(0.0, 0.0),
        [&](const cv::Mat&) {
            if (++calls == 2) { throw RecognitionError("timed out"); }
            return RecognitionResult{"rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR", "w"};
        },
        [](std::chrono::milliseconds) {});

    auto first  = client.Recognize(MakeBoard());
    auto second = client.Recognize(MakeBoard());
    auto third  = client.Recognize(MakeBoard());

    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(second.has_value());
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->turn, "w");

    RecognitionStats stats = client.stats();
    EXPECT_EQ(stats.attempted, 3);
    EXPECT_EQ(stats.succeeded, 2);
    EXPECT_EQ(stats.failed, 1);
}

TEST(Recognition, UnexpectedExceptionIsContained) {
    RecognitionClient client(
        MakeConfig(0.0, 0.0), [](const cv::Mat&) -> RecognitionResult { throw std::runtime_error("socket"); },
        [](std::chrono::milliseconds) {});
    EXPECT_FALSE(client.Recognize(MakeBoard()).has_value());
    EXPECT_EQ(client.stats().failed, 1);
}

TEST(Recognition, EmptyFenCountsAsFailure) {
    RecognitionClient client(
        MakeConfig(0.0, 0.0), [](const cv::Mat&) { return RecognitionResult{"", "w"}; },
        [](std::chrono::milliseconds) {});
    EXPECT_FALSE(client.Recognize(MakeBoard()).has_value());
    EXPECT_EQ(client.stats().failed, 1);
    EXPECT_EQ(client.stats().succeeded, 0);
}

TEST(Recognition, DisabledClientNeverCalls) {
    int calls  = 0;
    int sleeps = 0;
    RecognitionConfig cfg = MakeConfig(1.0, 2.0);
    cfg.enabled           = false;
    RecognitionClient client(
        cfg,
        [&](const cv::Mat&) {
            ++calls;
            return RecognitionResult{"8/8/8/8/8/8/8/8", ""};
        },
        [&](std::chrono::milliseconds) { ++sleeps; });

    EXPECT_FALSE(client.enabled());
    EXPECT_FALSE(client.Recognize(MakeBoard()).has_value());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(sleeps, 0);
    EXPECT_EQ(client.stats().attempted, 0);

    RecognitionClient no_transport(MakeConfig(0.0, 0.0), nullptr);
    EXPECT_FALSE(no_transport.enabled());
    EXPECT_FALSE(no_transport.Recognize(MakeBoard()).has_value());
}

TEST(Chessvision, RequestBody) {
    const std::string body = ChessvisionTransport::BuildRequestBody("abc");
    nlohmann::json j       = nlohmann::json::parse(body);

    EXPECT_EQ(j["board_orientation"], "predict");
    EXPECT_EQ(j["cropped"], true);
    EXPECT_EQ(j["current_player"], "white");
    EXPECT_EQ(j["predict_turn"], true);
    EXPECT_EQ(j["image"], "data:image/png;base64,YWJj");
}

TEST(Chessvision, ParseResponse) {
    RecognitionResult r =
        ChessvisionTransport::ParseResponseBody(R"({"result": "8/8/8/8/8/8/8/K6k", "turn": "b"})");
    EXPECT_EQ(r.fen, "8/8/8/8/8/8/8/K6k");
    EXPECT_EQ(r.turn, "b");

    RecognitionResult no_turn = ChessvisionTransport::ParseResponseBody(R"({"result": "8/8/8/8/8/8/8/K6k"})");
    EXPECT_TRUE(no_turn.turn.empty());
}

TEST(Chessvision, MalformedResponsesThrow) {
    EXPECT_THROW(ChessvisionTransport::ParseResponseBody("not json"), RecognitionError);
    EXPECT_THROW(ChessvisionTransport::ParseResponseBody("[1, 2]"), RecognitionError);
    EXPECT_THROW(ChessvisionTransport::ParseResponseBody(R"({"turn": "w"})"), RecognitionError);
    EXPECT_THROW(ChessvisionTransport::ParseResponseBody(R"({"result": null})"), RecognitionError);
    EXPECT_THROW(ChessvisionTransport::ParseResponseBody(R"({"result": ""})"), RecognitionError);
}

TEST(Encoding, Base64) {
    EXPECT_EQ(EncodeBase64(""), "");
    EXPECT_EQ(EncodeBase64("f"), "Zg==");
    EXPECT_EQ(EncodeBase64("fo"), "Zm8=");
    EXPECT_EQ(EncodeBase64("foo"), "Zm9v");
    EXPECT_EQ(EncodeBase64("foobar"), "Zm9vYmFy");
}

TEST(Encoding, PngSignature) {
    std::vector<uint8_t> png = EncodePng(MakeBoard());
    ASSERT_GT(png.size(), 8u);
    EXPECT_EQ(png[0], 0x89);
    EXPECT_EQ(png[1], 'P');
    EXPECT_EQ(png[2], 'N');
    EXPECT_EQ(png[3], 'G');
    EXPECT_THROW(EncodePng(cv::Mat()), InputError);
}
