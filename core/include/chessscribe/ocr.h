/// \file ocr.h
/// \brief Digit OCR collaborator used by the bubble analyzer.

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// Reads the digits in a small image. Returns an empty string when nothing
/// was recognized; must not throw.
using DigitReader = std::function<std::string(const cv::Mat& image)>;

/// Tesseract settings.
struct OcrConfig {
    std::string tessdata_path;       ///< Empty = Tesseract default lookup.
    std::string language = "eng";
    int min_confidence   = 40;       ///< Mean word confidence floor [0, 100].
};

/// Tesseract-backed digit reader (digit whitelist, single-word segmentation).
class TesseractDigitReader {
public:
    /// Throws ConfigError when Tesseract cannot be initialized.
    explicit TesseractDigitReader(const OcrConfig& config = {});
    ~TesseractDigitReader();

    TesseractDigitReader(const TesseractDigitReader&)            = delete;
    TesseractDigitReader& operator=(const TesseractDigitReader&) = delete;

    /// Returns the recognized digits, or an empty string.
    std::string Read(const cv::Mat& image);

    /// Adapts this reader to the DigitReader signature. The reader must outlive it.
    DigitReader AsDigitReader();

private:
    struct Impl;

    OcrConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace ChessScribe
