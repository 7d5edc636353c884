#ifndef OMR_REPORT_RENDERER_HPP
#define OMR_REPORT_RENDERER_HPP

#include <opencv2/core.hpp>
#include <string>
#include "omr/AnswerKey.hpp"
#include "omr/ScoreCalculator.hpp"

namespace omr {

class ReportRenderer {
public:
    ReportRenderer() = default;

    // Annotated copy of the student sheet. score/total < 0 leaves the score
    // line out.
    cv::Mat render(const cv::Mat& studentImage,
                   const AnswerKey& studentAnswers,
                   const AnswerKey& correctAnswers,
                   const CoordinateMap& coordinates,
                   const std::string& studentName = "",
                   int score = -1,
                   int total = -1) const;

    cv::Mat render(const cv::Mat& studentImage,
                   const GradingResult& result,
                   const std::string& studentName) const;

    // Writes <name>_<unix seconds>.png into saveDir and returns the file name.
    // Throws ReportError.
    std::string save(const cv::Mat& report,
                     const std::string& saveDir,
                     const std::string& studentName = "student") const;

    static std::string sanitizeFileName(const std::string& name);

private:
    int boxThickness_ = 4;
};

}

#endif // OMR_REPORT_RENDERER_HPP
