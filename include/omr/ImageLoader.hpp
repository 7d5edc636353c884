#ifndef OMR_IMAGE_LOADER_HPP
#define OMR_IMAGE_LOADER_HPP

#include <opencv2/core.hpp>
#include <string>
#include "omr/SheetSource.hpp"

namespace omr {

struct LoaderConfig {
    double pdfDpi = 200.0;   // rasterization resolution for PDF sheets
    int blurKernel = 5;      // odd size of the Gaussian smoothing kernel
};

struct LoadedSheet {
    cv::Mat inkMask;   // CV_8UC1, 255 = ink
    cv::Mat image;     // decoded BGR sheet, kept for the report
};

class ImageLoader {
public:
    explicit ImageLoader(const LoaderConfig& config = LoaderConfig());

    LoadedSheet load(const std::string& path) const;
    LoadedSheet load(const SheetSource& source) const;

    // Grayscale -> blur -> inverted Otsu threshold
    cv::Mat binarize(const cv::Mat& image) const;

    const LoaderConfig& config() const { return config_; }

private:
    LoaderConfig config_;
};

}

#endif // OMR_IMAGE_LOADER_HPP
