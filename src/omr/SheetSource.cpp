#include "omr/SheetSource.hpp"
#include "omr/Errors.hpp"
#include "omr/Log.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page.h>
#include <poppler-page-renderer.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <memory>

namespace omr {

namespace {

std::string lowerExtension(const std::string& name) {
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

cv::Mat renderFirstPage(poppler::document* doc, double dpi, const std::string& origin) {
    if (!doc) {
        throw LoadError("Could not convert PDF to image: failed to open " + origin);
    }
    std::unique_ptr<poppler::document> owned(doc);

    if (owned->is_locked()) {
        throw LoadError("Could not convert PDF to image: " + origin + " is password protected");
    }
    if (owned->pages() < 1) {
        throw LoadError("Could not convert PDF to image: " + origin + " has no pages");
    }

    std::unique_ptr<poppler::page> page(owned->create_page(0));
    if (!page) {
        throw LoadError("Could not convert PDF to image: cannot open first page of " + origin);
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image rendered = renderer.render_page(page.get(), dpi, dpi);
    if (!rendered.is_valid() || rendered.format() != poppler::image::format_argb32) {
        throw LoadError("Could not convert PDF to image: rendering failed for " + origin);
    }

    // ARGB32 is stored as B,G,R,A bytes; the poppler buffer dies with `rendered`
    cv::Mat bgra(rendered.height(), rendered.width(), CV_8UC4,
                 rendered.data(), static_cast<size_t>(rendered.bytes_per_row()));
    cv::Mat bgr;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

}

cv::Mat RasterSource::decode() const {
    cv::Mat image;
    try {
        if (!bytes.empty()) {
            image = cv::imdecode(bytes, cv::IMREAD_COLOR);
        } else {
            image = cv::imread(path, cv::IMREAD_COLOR);
        }
    } catch (const cv::Exception& e) {
        throw LoadError("Could not load image: " + (path.empty() ? "<buffer>" : path) +
                        " (" + e.what() + ")");
    }

    if (image.empty()) {
        throw LoadError("Could not load image: " + (path.empty() ? "<buffer>" : path));
    }
    return image;
}

cv::Mat PdfSource::decode(double dpi) const {
    if (!bytes.empty()) {
        const int length = checkedBufferLength(bytes.size(), "<buffer>");
        poppler::document* doc = poppler::document::load_from_raw_data(
            reinterpret_cast<const char*>(bytes.data()), length);
        return renderFirstPage(doc, dpi, "<buffer>");
    }
    return renderFirstPage(poppler::document::load_from_file(path), dpi, path);
}

SheetSource SheetSource::fromPath(const std::string& path) {
    if (lowerExtension(path) == "pdf") {
        return SheetSource(PdfSource{path, {}});
    }
    return SheetSource(RasterSource{path, {}});
}

SheetSource SheetSource::fromBuffer(std::vector<unsigned char> bytes, Kind kind) {
    if (kind == Kind::Pdf) {
        return SheetSource(PdfSource{"", std::move(bytes)});
    }
    return SheetSource(RasterSource{"", std::move(bytes)});
}

SheetSource::Kind SheetSource::kind() const {
    return std::holds_alternative<PdfSource>(source_) ? Kind::Pdf : Kind::Raster;
}

std::string SheetSource::describe() const {
    return std::visit([](const auto& s) -> std::string {
        if (!s.path.empty()) return s.path;
        return "<" + std::to_string(s.bytes.size()) + " byte buffer>";
    }, source_);
}

cv::Mat SheetSource::decode(double pdfDpi) const {
    if (const auto* pdf = std::get_if<PdfSource>(&source_)) {
        log::debug("rasterizing " + describe() + " at " + std::to_string(pdfDpi) + " dpi");
        return pdf->decode(pdfDpi);
    }
    return std::get<RasterSource>(source_).decode();
}

bool isSupportedSheetFile(const std::string& filename) {
    const std::string ext = lowerExtension(filename);
    return ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "pdf";
}

int checkedBufferLength(std::size_t size, const std::string& origin) {
    if (size > static_cast<std::size_t>(INT_MAX)) {
        throw LoadError("Could not convert PDF to image: " + origin + " is too large (" +
                        std::to_string(size) + " bytes)");
    }
    return static_cast<int>(size);
}

}
