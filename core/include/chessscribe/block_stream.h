/// \file block_stream.h
/// \brief Flattens a document into one globally indexed block sequence.

#pragma once

#include "common.h"
#include "document.h"

#include <cstddef>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace ChessScribe {

/// One text or image region, globally ordered. Immutable once produced.
struct Block {
    int page         = 0; ///< 1-based page number.
    int index        = 0; ///< Position within its page after ordering.
    int global_index = 0; ///< Position within the whole stream.
    BlockKind kind   = BlockKind::Text;
    std::string text; ///< Trimmed text (Text blocks only).
    cv::Mat image;    ///< BGR pixels (Image blocks only).
    cv::Rect2f bbox;

    bool IsText() const { return kind == BlockKind::Text; }
    bool IsImage() const { return kind == BlockKind::Image; }
};

/// Inclusive, 1-based page range. 0 on either side means unbounded.
struct PageRange {
    int first = 0;
    int last  = 0;

    bool Contains(int page) const {
        if (first > 0 && page < first) { return false; }
        if (last > 0 && page > last) { return false; }
        return true;
    }
};

/// Ordered blocks of a document (or of a page range of it).
struct BlockStream {
    std::vector<Block> blocks; ///< blocks[i].global_index == i
    int pages_visited = 0;
    int pages_failed  = 0; ///< Pages whose regions could not be loaded.

    size_t size() const { return blocks.size(); }
    bool empty() const { return blocks.empty(); }
    const Block& operator[](size_t i) const { return blocks[i]; }
};

/// Orders the regions of one page top-to-bottom, then left-to-right.
std::vector<PageRegion> OrderRegions(std::vector<PageRegion> regions);

/// Appends one page's regions to a stream, continuing its global counter.
/// Empty text and empty images are skipped.
void AppendPage(BlockStream& stream, const Page& page);

/// Visits the pages of a document in order and builds the block stream.
/// \param source Document to read
/// \param range Pages to visit (clamped to the document)
BlockStream BuildBlockStream(DocumentSource& source, const PageRange& range = {});

/// Builds a stream from already loaded pages (kept in the given order).
BlockStream BuildBlockStream(const std::vector<Page>& pages);

} // namespace ChessScribe
