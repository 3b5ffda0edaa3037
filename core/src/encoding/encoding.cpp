#include "chessscribe/encoding.h"
#include "chessscribe/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <system_error>

namespace ChessScribe {

constexpr int kPngCompression = 6;

std::vector<uint8_t> EncodePng(const cv::Mat& image) {
    if (image.empty()) { throw InputError("EncodePng: image is empty"); }
    std::vector<uint8_t> buf;
    const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, kPngCompression};
    if (!cv::imencode(".png", image, buf, params)) {
        throw IOError("EncodePng: cv::imencode failed");
    }
    spdlog::debug("EncodePng: {}x{} -> {} bytes", image.cols, image.rows, buf.size());
    return buf;
}

std::string EncodeBase64(const std::string& bytes) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const uint32_t v = (static_cast<uint8_t>(bytes[i]) << 16) |
                           (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                           static_cast<uint8_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
        out.push_back(kAlphabet[v & 0x3F]);
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint32_t v = static_cast<uint8_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const uint32_t v = (static_cast<uint8_t>(bytes[i]) << 16) |
                           (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

bool SaveImage(const cv::Mat& image, const std::string& path) {
    if (image.empty() || path.empty()) { return false; }
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::warn("SaveImage: cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }
    return cv::imwrite(path, image);
}

} // namespace ChessScribe
