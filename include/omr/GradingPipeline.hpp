#ifndef OMR_GRADING_PIPELINE_HPP
#define OMR_GRADING_PIPELINE_HPP

#include <opencv2/core.hpp>
#include <optional>
#include "omr/BubbleDetector.hpp"
#include "omr/ImageLoader.hpp"
#include "omr/ScoreCalculator.hpp"
#include "omr/SheetSource.hpp"

namespace omr {

struct ProcessedSheet {
    SheetReading reading;
    cv::Mat image;   // decoded sheet, for the report
};

struct PipelineResult {
    ProcessedSheet student;
    std::optional<GradingResult> grading;   // empty when no key sheet was given
};

// load -> detect -> grade for one request
class GradingPipeline {
public:
    GradingPipeline(const LoaderConfig& loaderConfig = LoaderConfig(),
                    const DetectorConfig& detectorConfig = DetectorConfig(),
                    const GradingPolicy& policy = GradingPolicy());

    ProcessedSheet readSheet(const SheetSource& source) const;

    PipelineResult process(const SheetSource& studentSheet) const;
    PipelineResult process(const SheetSource& studentSheet, const SheetSource& keySheet) const;

    const BubbleDetector& detector() const { return detector_; }

private:
    ImageLoader loader_;
    BubbleDetector detector_;
    ScoreCalculator calculator_;
};

}

#endif // OMR_GRADING_PIPELINE_HPP
