#include "chessscribe/ocr.h"
#include "chessscribe/error.h"
#include "detail/cv_utils.h"

#include <spdlog/spdlog.h>

#include <tesseract/baseapi.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace ChessScribe {

struct TesseractDigitReader::Impl {
    std::unique_ptr<tesseract::TessBaseAPI> api = std::make_unique<tesseract::TessBaseAPI>();

    ~Impl() {
        if (api) { api->End(); }
    }
};

TesseractDigitReader::TesseractDigitReader(const OcrConfig& config)
    : config_(config), impl_(std::make_unique<Impl>()) {
    const char* datapath = config_.tessdata_path.empty() ? nullptr : config_.tessdata_path.c_str();
    if (impl_->api->Init(datapath, config_.language.c_str()) != 0) {
        throw ConfigError("Cannot initialize Tesseract (language '" + config_.language + "')");
    }
    impl_->api->SetPageSegMode(tesseract::PSM_SINGLE_WORD);
    impl_->api->SetVariable("tessedit_char_whitelist", "0123456789");
    spdlog::debug("Tesseract {} ready (language {})", tesseract::TessBaseAPI::Version(),
                  config_.language);
}

TesseractDigitReader::~TesseractDigitReader() = default;

std::string TesseractDigitReader::Read(const cv::Mat& image) {
    cv::Mat gray = detail::ToGray(image);
    if (gray.empty()) { return {}; }
    if (!gray.isContinuous()) { gray = gray.clone(); }

    impl_->api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    std::unique_ptr<char[]> raw(impl_->api->GetUTF8Text());
    const int confidence = impl_->api->MeanTextConf();
    impl_->api->Clear();
    if (!raw) { return {}; }

    std::string digits;
    for (const char* p = raw.get(); *p; ++p) {
        if (std::isdigit(static_cast<unsigned char>(*p))) { digits += *p; }
    }
    if (confidence < config_.min_confidence) {
        spdlog::debug("OCR '{}' below confidence floor ({} < {})", digits, confidence,
                      config_.min_confidence);
        return {};
    }
    return digits;
}

DigitReader TesseractDigitReader::AsDigitReader() {
    return [this](const cv::Mat& image) { return Read(image); };
}

} // namespace ChessScribe
