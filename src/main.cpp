#include <opencv2/imgcodecs.hpp>
#include "omr/CommandLine.hpp"
#include "omr/Errors.hpp"
#include "omr/GradingPipeline.hpp"
#include "omr/Log.hpp"
#include "omr/ReportRenderer.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::string joinAnswers(const std::vector<std::string>& answers) {
    std::string out;
    for (size_t i = 0; i < answers.size(); ++i) {
        if (i) out += ", ";
        out += std::to_string(i + 1) + ":" + (answers[i].empty() ? "-" : answers[i]);
    }
    return out;
}

void printReading(const omr::SheetReading& reading) {
    std::cout << "Detected Questions: " << reading.questionCount << "\n";
    std::cout << "Student Answers: " << joinAnswers(reading.answers.toList(reading.questionCount)) << "\n";
}

void printGrading(const omr::GradingResult& r) {
    std::cout << "--- Grading Results ---\n";
    std::cout << "Total Questions: " << r.totalQuestions() << "\n";
    std::cout << "Correct Answers: " << r.correctCount() << "\n";
    std::cout << "Incorrect Answers: " << r.incorrectCount() << "\n";
    std::cout << "Unanswered Questions: " << r.unansweredCount() << "\n";
    std::cout << "Final Score: " << r.score() << " ("
              << std::fixed << std::setprecision(2) << r.percentage() << "%)\n";

    std::vector<std::string> student, correct;
    for (const auto& o : r.outcomes()) {
        student.push_back(o.studentAnswer.empty() ? omr::AnswerKey::kUnanswered : o.studentAnswer);
        correct.push_back(o.correctAnswer.empty() ? "N/A" : o.correctAnswer);
    }
    std::cout << "\nStudent Answers: " << joinAnswers(student) << "\n";
    std::cout << "Correct Answers: " << joinAnswers(correct) << "\n";
}

void saveDebugOverlay(const omr::GradingPipeline& pipeline,
                      const omr::ProcessedSheet& sheet,
                      const std::string& dir,
                      const std::string& name)
{
    cv::Mat overlay = sheet.image.clone();
    pipeline.detector().drawBubbleDebug(overlay, sheet.reading);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    const std::string path = (std::filesystem::path(dir) / ("debug_" + name + ".png")).string();
    if (ec || !cv::imwrite(path, overlay)) {
        omr::log::warn("could not save debug overlay " + path);
        return;
    }
    omr::log::debug("debug overlay saved to " + path);
}

}

int main(int argc, char** argv) {
    omr::GradeOptions opt;
    if (!omr::parseGradeOptions(std::vector<std::string>(argv + 1, argv + argc), opt, std::cerr)) {
        omr::printUsage(std::cerr);
        return 1;
    }
    omr::log::setDebug(opt.debug);

    omr::GradingPipeline pipeline(opt.loader, opt.detector, opt.policy);
    omr::ReportRenderer renderer;

    try {
        const auto student = omr::SheetSource::fromPath(opt.studentPath);

        if (opt.keyPath.empty()) {
            omr::PipelineResult result = pipeline.process(student);
            if (!result.student.reading.found()) {
                omr::log::warn("no bubbles detected on " + opt.studentPath);
            }
            printReading(result.student.reading);
            if (opt.writesDebugOverlay()) {
                saveDebugOverlay(pipeline, result.student, opt.reportDir,
                                 omr::ReportRenderer::sanitizeFileName(opt.studentName));
            }
            return 0;
        }

        const auto key = omr::SheetSource::fromPath(opt.keyPath);
        omr::PipelineResult result = pipeline.process(student, key);
        const omr::GradingResult& grading = *result.grading;

        printGrading(grading);

        if (opt.writesDebugOverlay()) {
            saveDebugOverlay(pipeline, result.student, opt.reportDir,
                             omr::ReportRenderer::sanitizeFileName(opt.studentName));
        }

        if (opt.writeReport) {
            cv::Mat report = renderer.render(result.student.image, grading, opt.studentName);
            std::string filename = renderer.save(report, opt.reportDir, opt.studentName);
            std::cout << "\nReport: " << (std::filesystem::path(opt.reportDir) / filename).string() << "\n";
        }
    } catch (const omr::LoadError& e) {
        omr::log::error(std::string("Error: ") + e.what());
        return 2;
    } catch (const omr::ConfigError& e) {
        omr::log::error(std::string("Error: ") + e.what());
        return 3;
    } catch (const omr::ReportError& e) {
        omr::log::error(std::string("Error: ") + e.what());
        return 4;
    }

    return 0;
}
