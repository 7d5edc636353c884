#ifndef OMR_SHEET_SOURCE_HPP
#define OMR_SHEET_SOURCE_HPP

#include <opencv2/core.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace omr {

// Encoded raster image (PNG, JPEG, ...), read from disk or memory.
struct RasterSource {
    std::string path;
    std::vector<unsigned char> bytes;

    cv::Mat decode() const;
};

// PDF document; only the first page is rendered.
struct PdfSource {
    std::string path;
    std::vector<unsigned char> bytes;

    cv::Mat decode(double dpi) const;
};

class SheetSource {
public:
    enum class Kind {
        Raster,
        Pdf
    };

    // Kind chosen from the file extension (".pdf" -> Pdf, anything else -> Raster)
    static SheetSource fromPath(const std::string& path);
    static SheetSource fromBuffer(std::vector<unsigned char> bytes, Kind kind);

    Kind kind() const;

    // Human readable origin for logs and error messages
    std::string describe() const;

    // Decoded 8-bit BGR image. Throws LoadError.
    cv::Mat decode(double pdfDpi = 200.0) const;

private:
    explicit SheetSource(std::variant<RasterSource, PdfSource> source)
        : source_(std::move(source)) {}

    std::variant<RasterSource, PdfSource> source_;
};

// Upload-style extension check: png, jpg, jpeg, pdf (case-insensitive)
bool isSupportedSheetFile(const std::string& filename);

// Buffer length as poppler's int, LoadError when it does not fit
int checkedBufferLength(std::size_t size, const std::string& origin);

}

#endif // OMR_SHEET_SOURCE_HPP
