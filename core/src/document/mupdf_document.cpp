#include "chessscribe/document.h"
#include "chessscribe/error.h"

#include <spdlog/spdlog.h>

#include <opencv2/imgproc.hpp>

#include <mupdf/fitz.h>

#include <cstring>
#include <string>

namespace ChessScribe {

struct MuPdfDocument::Impl {
    fz_context* ctx  = nullptr;
    fz_document* doc = nullptr;
    int page_count   = 0;

    ~Impl() {
        if (doc) { fz_drop_document(ctx, doc); }
        if (ctx) { fz_drop_context(ctx); }
    }
};

namespace {

cv::Rect2f ToRect(const fz_rect& r) { return cv::Rect2f(r.x0, r.y0, r.x1 - r.x0, r.y1 - r.y0); }

// Copies an RGB(A) or gray pixmap into a BGR cv::Mat.
cv::Mat PixmapToMat(fz_context* ctx, fz_pixmap* pix) {
    const int w      = fz_pixmap_width(ctx, pix);
    const int h      = fz_pixmap_height(ctx, pix);
    const int n      = fz_pixmap_components(ctx, pix);
    const int stride = static_cast<int>(fz_pixmap_stride(ctx, pix));
    if (w <= 0 || h <= 0 || (n != 1 && n != 2 && n != 3 && n != 4)) { return cv::Mat(); }

    cv::Mat view(h, w, CV_8UC(n), fz_pixmap_samples(ctx, pix), static_cast<size_t>(stride));
    cv::Mat bgr;
    switch (n) {
    case 1:
        cv::cvtColor(view, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 2: {
        cv::Mat gray;
        cv::extractChannel(view, gray, 0);
        cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
        break;
    }
    case 3:
        cv::cvtColor(view, bgr, cv::COLOR_RGB2BGR);
        break;
    default:
        cv::cvtColor(view, bgr, cv::COLOR_RGBA2BGR);
        break;
    }
    return bgr;
}

std::string BlockText(fz_stext_block* block) {
    std::string text;
    char buf[8];
    for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
        if (!text.empty()) { text += '\n'; }
        for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
            int len = fz_runetochar(buf, ch->c);
            text.append(buf, static_cast<size_t>(len));
        }
    }
    return text;
}

// MuPDF objects of one call. Dropped on scope exit, so C++ code that throws
// after the fz_try block cannot leak them.
struct FzObjects {
    explicit FzObjects(fz_context* c) : ctx(c) {}
    FzObjects(const FzObjects&)            = delete;
    FzObjects& operator=(const FzObjects&) = delete;
    ~FzObjects() {
        fz_drop_pixmap(ctx, rgb);
        fz_drop_pixmap(ctx, pix);
        fz_drop_stext_page(ctx, stext);
        fz_drop_page(ctx, page);
    }

    fz_context* ctx;
    fz_page* page        = nullptr;
    fz_stext_page* stext = nullptr;
    fz_pixmap* pix       = nullptr;
    fz_pixmap* rgb       = nullptr;
};

cv::Mat ImageBlockToMat(fz_context* ctx, fz_image* image) {
    FzObjects objs(ctx);
    bool failed = false;
    std::string error;

    fz_var(objs.pix);
    fz_var(objs.rgb);
    fz_try(ctx) {
        objs.pix = fz_get_pixmap_from_image(ctx, image, nullptr, nullptr, nullptr, nullptr);
        fz_colorspace* space = fz_pixmap_colorspace(ctx, objs.pix);
        if (space && space != fz_device_rgb(ctx) && space != fz_device_gray(ctx)) {
            objs.rgb = fz_convert_pixmap(ctx, objs.pix, fz_device_rgb(ctx), nullptr, nullptr,
                                         fz_default_color_params, 0);
        }
    }
    fz_catch(ctx) {
        failed = true;
        error  = fz_caught_message(ctx);
    }

    if (failed) {
        spdlog::warn("Image block skipped: {}", error);
        return cv::Mat();
    }
    return PixmapToMat(ctx, objs.rgb ? objs.rgb : objs.pix);
}

} // namespace

MuPdfDocument::MuPdfDocument(const std::string& path) : path_(path), impl_(std::make_unique<Impl>()) {
    impl_->ctx = fz_new_context(nullptr, nullptr, FZ_STORE_UNLIMITED);
    if (!impl_->ctx) { throw IOError("Cannot create MuPDF context"); }

    fz_context* ctx = impl_->ctx;
    std::string error;
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        impl_->doc        = fz_open_document(ctx, path.c_str());
        impl_->page_count = fz_count_pages(ctx, impl_->doc);
    }
    fz_catch(ctx) { error = fz_caught_message(ctx); }

    if (!error.empty()) { throw IOError("Cannot open document " + path + ": " + error); }
    spdlog::info("Opened {} ({} pages)", path, impl_->page_count);
}

MuPdfDocument::~MuPdfDocument() = default;

int MuPdfDocument::PageCount() const { return impl_->page_count; }

Page MuPdfDocument::LoadPage(int page_number) {
    if (page_number < 1 || page_number > impl_->page_count) {
        throw InputError("Page out of range: " + std::to_string(page_number));
    }

    fz_context* ctx = impl_->ctx;
    FzObjects objs(ctx);
    bool failed = false;
    std::string error;

    // Only MuPDF calls run inside fz_try; regions are built afterwards.
    fz_var(objs.page);
    fz_var(objs.stext);
    fz_try(ctx) {
        objs.page = fz_load_page(ctx, impl_->doc, page_number - 1);

        fz_stext_options options;
        std::memset(&options, 0, sizeof(options));
        options.flags = FZ_STEXT_PRESERVE_IMAGES;
        objs.stext    = fz_new_stext_page_from_page(ctx, objs.page, &options);
    }
    fz_catch(ctx) {
        failed = true;
        error  = fz_caught_message(ctx);
    }

    if (failed) {
        throw IOError("Cannot load page " + std::to_string(page_number) + ": " + error);
    }

    Page result;
    result.number = page_number;
    for (fz_stext_block* block = objs.stext->first_block; block; block = block->next) {
        PageRegion region;
        region.bbox = ToRect(block->bbox);
        if (block->type == FZ_STEXT_BLOCK_TEXT) {
            region.kind = BlockKind::Text;
            region.text = BlockText(block);
        } else if (block->type == FZ_STEXT_BLOCK_IMAGE) {
            region.kind  = BlockKind::Image;
            region.image = ImageBlockToMat(ctx, block->u.i.image);
        } else {
            continue;
        }
        result.regions.push_back(std::move(region));
    }
    return result;
}

cv::Mat MuPdfDocument::RenderPage(int page_number, float dpi) {
    if (page_number < 1 || page_number > impl_->page_count) {
        throw InputError("Page out of range: " + std::to_string(page_number));
    }
    if (dpi <= 0.0f) { throw InputError("Render resolution must be positive"); }

    fz_context* ctx = impl_->ctx;
    FzObjects objs(ctx);
    bool failed = false;
    std::string error;

    fz_var(objs.page);
    fz_var(objs.pix);
    fz_try(ctx) {
        objs.page = fz_load_page(ctx, impl_->doc, page_number - 1);
        objs.pix  = fz_new_pixmap_from_page(ctx, objs.page, fz_scale(dpi / 72.0f, dpi / 72.0f),
                                            fz_device_rgb(ctx), 0);
    }
    fz_catch(ctx) {
        failed = true;
        error  = fz_caught_message(ctx);
    }

    if (failed) {
        throw IOError("Cannot render page " + std::to_string(page_number) + ": " + error);
    }
    cv::Mat out = PixmapToMat(ctx, objs.pix);
    if (out.empty()) { throw IOError("Empty rendering of page " + std::to_string(page_number)); }
    return out;
}

} // namespace ChessScribe
