/// \file encoding.h
/// \brief Image encoding and file I/O utilities.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// Encodes an OpenCV image to PNG format.
/// \param image Input image (BGR or grayscale)
/// \return PNG-encoded image data
std::vector<uint8_t> EncodePng(const cv::Mat& image);

/// Encodes bytes as standard base64 (with padding).
std::string EncodeBase64(const std::string& bytes);

/// Saves an OpenCV image to a file (format determined by extension),
/// creating parent directories as needed.
/// \return True if successful, false otherwise
bool SaveImage(const cv::Mat& image, const std::string& path);

} // namespace ChessScribe
