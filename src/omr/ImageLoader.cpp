#include "omr/ImageLoader.hpp"
#include "omr/Errors.hpp"
#include "omr/Log.hpp"

#include <opencv2/imgproc.hpp>

using namespace cv;

namespace omr {

ImageLoader::ImageLoader(const LoaderConfig& config)
    : config_(config)
{
    if (config_.blurKernel < 1) config_.blurKernel = 1;
    if ((config_.blurKernel & 1) == 0) config_.blurKernel += 1;
}

LoadedSheet ImageLoader::load(const std::string& path) const {
    return load(SheetSource::fromPath(path));
}

LoadedSheet ImageLoader::load(const SheetSource& source) const {
    LoadedSheet sheet;
    sheet.image = source.decode(config_.pdfDpi);
    sheet.inkMask = binarize(sheet.image);

    log::debug("loaded " + source.describe() + " (" + std::to_string(sheet.image.cols) +
               "x" + std::to_string(sheet.image.rows) + ")");
    return sheet;
}

cv::Mat ImageLoader::binarize(const cv::Mat& image) const {
    if (image.empty()) {
        throw LoadError("Could not binarize an empty image");
    }

    cv::Mat gray;
    try {
        switch (image.channels()) {
        case 1:
            gray = image;
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        }
        if (gray.depth() == CV_16U) {
            gray.convertTo(gray, CV_8U, 1.0 / 257.0);
        } else if (gray.depth() != CV_8U) {
            throw LoadError("Could not binarize image: unsupported sample depth " +
                            std::to_string(gray.depth()));
        }

        cv::Mat blurImg, mask;
        cv::GaussianBlur(gray, blurImg, cv::Size(config_.blurKernel, config_.blurKernel), 0);
        cv::threshold(blurImg, mask, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
        return mask;
    } catch (const cv::Exception& e) {
        throw LoadError(std::string("Could not binarize image: ") + e.what());
    }
}

}
