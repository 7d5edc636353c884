#include "omr/ReportRenderer.hpp"
#include "omr/Errors.hpp"
#include "omr/Log.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <vector>

using namespace cv;

namespace omr {

namespace {

const cv::Scalar kGreen(0, 160, 0);
const cv::Scalar kRed(0, 0, 255);
const cv::Scalar kBlack(0, 0, 0);

}

cv::Mat ReportRenderer::render(const cv::Mat& studentImage,
                               const AnswerKey& studentAnswers,
                               const AnswerKey& correctAnswers,
                               const CoordinateMap& coordinates,
                               const std::string& studentName,
                               int score,
                               int total) const
{
    cv::Mat img;
    if (studentImage.empty()) return img;

    if (studentImage.channels() == 1) {
        cv::cvtColor(studentImage, img, cv::COLOR_GRAY2BGR);
    } else if (studentImage.channels() == 4) {
        cv::cvtColor(studentImage, img, cv::COLOR_BGRA2BGR);
    } else {
        img = studentImage.clone();
    }

    const bool hasScore = score >= 0 && total >= 0;
    if (!studentName.empty() || hasScore) {
        std::vector<std::string> lines{"Student: " + studentName};
        if (hasScore) {
            lines.push_back("Score: " + std::to_string(score) + "/" + std::to_string(total));
        }

        int y = 34;
        for (const auto& line : lines) {
            cv::putText(img, line, cv::Point(10, y), cv::FONT_HERSHEY_SIMPLEX, 0.8, kBlack, 2);
            y += 30;
        }
    }

    for (const auto& [question, options] : coordinates) {
        const std::string student = studentAnswers.answerFor(question);
        const std::string correct = correctAnswers.answerFor(question);
        const bool isCorrect = student == correct;

        for (const auto& [option, box] : options) {
            const std::string letter(1, option);
            const cv::Point p1(box.x, box.y);
            const cv::Point p2(box.x + box.width, box.y + box.height);

            if (correct == letter) {
                cv::rectangle(img, p1, p2, kGreen, boxThickness_);
            }

            if (student == letter) {
                if (isCorrect) {
                    cv::rectangle(img, p1, p2, kGreen, boxThickness_);
                } else {
                    cv::rectangle(img, p1, p2, kRed, boxThickness_);
                    cv::line(img, p1, p2, kRed, boxThickness_);
                    cv::line(img, cv::Point(p1.x, p2.y), cv::Point(p2.x, p1.y), kRed, boxThickness_);
                }
            }
        }
    }

    return img;
}

cv::Mat ReportRenderer::render(const cv::Mat& studentImage,
                               const GradingResult& result,
                               const std::string& studentName) const
{
    return render(studentImage, result.studentAnswers(), result.correctAnswers(),
                  result.studentCoordinates(), studentName,
                  result.score(), result.totalQuestions());
}

std::string ReportRenderer::sanitizeFileName(const std::string& name) {
    std::string out;
    for (unsigned char c : name) {
        if (std::isspace(c)) {
            out += '_';
        } else if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out += static_cast<char>(c);
        }
    }

    // no hidden files, no trailing dots
    size_t a = 0, b = out.size();
    while (a < b && (out[a] == '.' || out[a] == '_')) a++;
    while (b > a && (out[b - 1] == '.' || out[b - 1] == '_')) b--;
    out = out.substr(a, b - a);

    return out.empty() ? "student" : out;
}

std::string ReportRenderer::save(const cv::Mat& report,
                                 const std::string& saveDir,
                                 const std::string& studentName) const
{
    if (report.empty()) {
        throw ReportError("Cannot save an empty report image");
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(saveDir, ec);
    if (ec) {
        throw ReportError("Cannot create report directory " + saveDir + ": " + ec.message());
    }

    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string filename = sanitizeFileName(studentName) + "_" + std::to_string(timestamp) + ".png";
    const std::string path = (fs::path(saveDir) / filename).string();

    bool written = false;
    try {
        written = cv::imwrite(path, report);
    } catch (const cv::Exception& e) {
        throw ReportError("Cannot write report " + path + ": " + e.what());
    }
    if (!written) {
        throw ReportError("Cannot write report " + path);
    }

    log::debug("report saved to " + path);
    return filename;
}

}
