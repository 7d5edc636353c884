#include "omr/GradingPipeline.hpp"
#include "omr/Log.hpp"

namespace omr {

GradingPipeline::GradingPipeline(const LoaderConfig& loaderConfig,
                                 const DetectorConfig& detectorConfig,
                                 const GradingPolicy& policy)
    : loader_(loaderConfig),
      detector_(detectorConfig),
      calculator_(policy)
{
}

ProcessedSheet GradingPipeline::readSheet(const SheetSource& source) const {
    LoadedSheet loaded = loader_.load(source);

    ProcessedSheet sheet;
    sheet.reading = detector_.detect(loaded.inkMask);
    sheet.image = loaded.image;

    log::debug(source.describe() + ": " + std::to_string(sheet.reading.questionCount) + " questions");
    return sheet;
}

PipelineResult GradingPipeline::process(const SheetSource& studentSheet) const {
    PipelineResult result;
    result.student = readSheet(studentSheet);
    return result;
}

PipelineResult GradingPipeline::process(const SheetSource& studentSheet,
                                        const SheetSource& keySheet) const
{
    PipelineResult result;
    result.student = readSheet(studentSheet);

    ProcessedSheet key = readSheet(keySheet);
    result.grading = calculator_.grade(result.student.reading, key.reading);
    return result;
}

}
