/// \file recognition.h
/// \brief Rate-limited client for the external position-recognition service.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// Recognition settings.
struct RecognitionConfig {
    bool enabled         = false;
    std::string endpoint = "http://app.chessvision.ai";
    std::string path     = "/predict";
    double min_delay_s   = 1.0; ///< Lower bound of the random pre-call delay.
    double max_delay_s   = 5.0; ///< Upper bound of the random pre-call delay.
    double timeout_s     = 10.0;
    uint32_t seed        = 0;   ///< Delay RNG seed (0 = random device).
};

/// What the service reports for one board.
struct RecognitionResult {
    std::string fen;
    std::string turn; ///< Side to move as reported, may be empty.
};

/// Performs one call. Throws on timeout, transport failure or malformed response.
using RecognizeFn = std::function<RecognitionResult(const cv::Mat& board)>;

/// Blocking wait used before each call.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// Call counters.
struct RecognitionStats {
    int attempted = 0;
    int succeeded = 0;
    int failed    = 0;
};

/// Serializes calls, delays each one randomly, and turns every failure into
/// an absent result.
class RecognitionClient {
public:
    /// \param transport Performs the call (e.g. ChessvisionTransport)
    /// \param sleeper Blocking wait (default: std::this_thread::sleep_for)
    RecognitionClient(const RecognitionConfig& config, RecognizeFn transport,
                      SleepFn sleeper = nullptr);

    /// Recognizes one board. Returns nullopt when disabled or on any failure.
    std::optional<RecognitionResult> Recognize(const cv::Mat& board);

    bool enabled() const { return config_.enabled && static_cast<bool>(transport_); }
    RecognitionStats stats() const;
    const RecognitionConfig& config() const { return config_; }

private:
    std::chrono::milliseconds NextDelay();

    RecognitionConfig config_;
    RecognizeFn transport_;
    SleepFn sleeper_;
    std::mt19937 rng_;
    RecognitionStats stats_;
    mutable std::mutex mutex_;
};

/// HTTP transport for the Chessvision predict endpoint (cpp-httplib).
class ChessvisionTransport {
public:
    explicit ChessvisionTransport(const RecognitionConfig& config);

    /// Sends the board as a base64 PNG data URL; throws RecognitionError.
    RecognitionResult operator()(const cv::Mat& board) const;

    /// Builds the JSON request body for a PNG payload.
    static std::string BuildRequestBody(const std::string& png_bytes);

    /// Parses a response body; throws RecognitionError when it is not usable.
    static RecognitionResult ParseResponseBody(const std::string& body);

private:
    RecognitionConfig config_;
};

} // namespace ChessScribe
