/// \file document.h
/// \brief Document-parsing collaborator: per-page text and image regions.

#pragma once

#include "common.h"

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// One text or image region of a page, as produced by the parsing library.
struct PageRegion {
    BlockKind kind = BlockKind::Text;
    cv::Rect2f bbox; ///< Page coordinates (points).
    std::string text; ///< Text content (Text regions only).
    cv::Mat image;    ///< BGR pixels (Image regions only).
};

/// All regions of one page; order within a page is not guaranteed.
struct Page {
    int number = 0; ///< 1-based page number.
    std::vector<PageRegion> regions;
};

/// Pull-based access to a multi-page document.
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /// Number of pages in the document.
    virtual int PageCount() const = 0;

    /// Loads the regions of one page.
    /// \param page_number 1-based page number
    virtual Page LoadPage(int page_number) = 0;

    /// Rasterizes a whole page to a BGR image.
    /// \param page_number 1-based page number
    /// \param dpi Output resolution
    virtual cv::Mat RenderPage(int page_number, float dpi) = 0;
};

/// DocumentSource backed by MuPDF.
///
/// Text regions are MuPDF structured-text blocks (lines joined with '\n');
/// image regions are the image blocks preserved by the structured-text device.
class MuPdfDocument : public DocumentSource {
public:
    /// Opens a document; throws IOError when it cannot be opened.
    explicit MuPdfDocument(const std::string& path);
    ~MuPdfDocument() override;

    MuPdfDocument(const MuPdfDocument&)            = delete;
    MuPdfDocument& operator=(const MuPdfDocument&) = delete;

    int PageCount() const override;
    Page LoadPage(int page_number) override;
    cv::Mat RenderPage(int page_number, float dpi) override;

    const std::string& path() const { return path_; }

private:
    struct Impl;

    std::string path_;
    std::unique_ptr<Impl> impl_;
};

} // namespace ChessScribe
