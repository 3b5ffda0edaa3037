#include "chessscribe/block_stream.h"
#include "chessscribe/error.h"
#include "chessscribe/notation.h"

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>

#include <algorithm>

namespace ChessScribe {

std::vector<PageRegion> OrderRegions(std::vector<PageRegion> regions) {
    std::stable_sort(regions.begin(), regions.end(), [](const PageRegion& a, const PageRegion& b) {
        if (a.bbox.y != b.bbox.y) { return a.bbox.y < b.bbox.y; }
        return a.bbox.x < b.bbox.x;
    });
    return regions;
}

void AppendPage(BlockStream& stream, const Page& page) {
    int index = 0;
    for (PageRegion& region : OrderRegions(page.regions)) {
        Block block;
        block.page = page.number;
        block.kind = region.kind;
        block.bbox = region.bbox;

        if (region.kind == BlockKind::Text) {
            block.text = Trim(region.text);
            if (block.text.empty()) { continue; }
        } else {
            if (region.image.empty()) { continue; }
            block.image = std::move(region.image);
        }

        block.index        = index++;
        block.global_index = static_cast<int>(stream.blocks.size());
        stream.blocks.push_back(std::move(block));
    }
    ++stream.pages_visited;
}

BlockStream BuildBlockStream(DocumentSource& source, const PageRange& range) {
    const int page_count = source.PageCount();
    const int first      = std::max(1, range.first);
    const int last       = range.last > 0 ? std::min(range.last, page_count) : page_count;

    BlockStream stream;
    for (int p = first; p <= last; ++p) {
        Page page;
        try {
            page = source.LoadPage(p);
        } catch (const Error& e) {
            spdlog::warn("Page {}: skipped ({})", p, e.what());
            ++stream.pages_failed;
            continue;
        } catch (const cv::Exception& e) {
            spdlog::warn("Page {}: skipped (OpenCV: {})", p, e.what());
            ++stream.pages_failed;
            continue;
        }
        page.number = p;
        AppendPage(stream, page);
        spdlog::debug("Page {}: {} regions, stream now {} blocks", p, page.regions.size(),
                      stream.size());
    }

    spdlog::info("Block stream: {} blocks from {} pages ({} failed)", stream.size(),
                 stream.pages_visited, stream.pages_failed);
    return stream;
}

BlockStream BuildBlockStream(const std::vector<Page>& pages) {
    BlockStream stream;
    for (const Page& page : pages) { AppendPage(stream, page); }
    return stream;
}

} // namespace ChessScribe
