#include "chessscribe/recognition.h"
#include "chessscribe/encoding.h"
#include "chessscribe/error.h"

#include <spdlog/spdlog.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <thread>

namespace ChessScribe {

RecognitionClient::RecognitionClient(const RecognitionConfig& config, RecognizeFn transport,
                                     SleepFn sleeper)
    : config_(config), transport_(std::move(transport)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (config_.seed != 0) {
        rng_.seed(config_.seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

std::chrono::milliseconds RecognitionClient::NextDelay() {
    const double lo = std::max(0.0, config_.min_delay_s);
    const double hi = std::max(lo, config_.max_delay_s);
    std::uniform_real_distribution<double> dist(lo, hi);
    const double seconds = std::clamp(dist(rng_), lo, hi);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::optional<RecognitionResult> RecognitionClient::Recognize(const cv::Mat& board) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled()) { return std::nullopt; }

    const auto delay = NextDelay();
    spdlog::debug("Waiting {} ms before recognition call", delay.count());
    sleeper_(delay);

    ++stats_.attempted;
    try {
        RecognitionResult result = transport_(board);
        if (result.fen.empty()) { throw RecognitionError("Empty FEN in response"); }
        ++stats_.succeeded;
        spdlog::debug("Recognition: {} (turn {})", result.fen, result.turn.empty() ? "?" : result.turn);
        return result;
    } catch (const std::exception& e) {
        ++stats_.failed;
        spdlog::warn("Recognition failed: {}", e.what());
        return std::nullopt;
    }
}

RecognitionStats RecognitionClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

ChessvisionTransport::ChessvisionTransport(const RecognitionConfig& config) : config_(config) {}

std::string ChessvisionTransport::BuildRequestBody(const std::string& png_bytes) {
    nlohmann::json j;
    j["board_orientation"] = "predict";
    j["cropped"]           = true;
    j["current_player"]    = "white";
    j["image"]             = "data:image/png;base64," + EncodeBase64(png_bytes);
    j["predict_turn"]      = true;
    return j.dump();
}

RecognitionResult ChessvisionTransport::ParseResponseBody(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) { throw RecognitionError("Malformed response body"); }

    RecognitionResult result;
    if (j.contains("result") && j["result"].is_string()) {
        result.fen = j["result"].get<std::string>();
    }
    if (result.fen.empty()) { throw RecognitionError("Response carries no FEN"); }
    if (j.contains("turn") && j["turn"].is_string()) { result.turn = j["turn"].get<std::string>(); }
    return result;
}

RecognitionResult ChessvisionTransport::operator()(const cv::Mat& board) const {
    std::vector<uint8_t> png = EncodePng(board);
    if (png.empty()) { throw RecognitionError("Cannot encode board image"); }
    const std::string body = BuildRequestBody(std::string(png.begin(), png.end()));

    const auto timeout = std::chrono::milliseconds(static_cast<long long>(config_.timeout_s * 1000.0));
    httplib::Client client(config_.endpoint);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    auto res = client.Post(config_.path, body, "application/json");
    if (!res) {
        throw RecognitionError("Request to " + config_.endpoint + config_.path +
                               " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw RecognitionError("Recognition service returned status " + std::to_string(res->status));
    }
    return ParseResponseBody(res->body);
}

} // namespace ChessScribe
