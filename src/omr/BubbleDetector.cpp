#include "omr/BubbleDetector.hpp"
#include "omr/Log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdlib>

using namespace cv;

namespace omr {

std::vector<QuestionRow> clusterRows(const std::vector<BlobRegion>& sortedByY, int tolerance) {
    std::vector<QuestionRow> rows;
    if (sortedByY.empty()) return rows;

    QuestionRow current{sortedByY.front()};
    int anchorY = sortedByY.front().box.y;

    for (size_t i = 1; i < sortedByY.size(); ++i) {
        const BlobRegion& blob = sortedByY[i];
        if (std::abs(blob.box.y - anchorY) <= tolerance) {
            current.push_back(blob);
        } else {
            rows.push_back(current);
            current = QuestionRow{blob};
            anchorY = blob.box.y;
        }
    }
    rows.push_back(current);
    return rows;
}

int chooseOption(const std::vector<int>& fills, int minFill) {
    int best = 0;
    int bestIdx = -1;
    for (size_t i = 0; i < fills.size(); ++i) {
        if (fills[i] > best) {
            best = fills[i];
            bestIdx = static_cast<int>(i);
        }
    }
    if (best <= minFill) return -1;
    return bestIdx;
}

BubbleDetector::BubbleDetector(const DetectorConfig& config)
    : config_(config)
{
}

bool BubbleDetector::isBubbleCandidate(const BlobRegion& blob) const {
    if (blob.area < config_.minArea || blob.area > config_.maxArea) return false;
    if (blob.box.height <= 0) return false;

    double aspect = static_cast<double>(blob.box.width) / blob.box.height;
    return aspect >= config_.minAspect && aspect <= config_.maxAspect;
}

std::vector<BlobRegion> BubbleDetector::findCandidates(const cv::Mat& inkMask) const {
    std::vector<BlobRegion> candidates;
    if (inkMask.empty()) return candidates;

    // any non-zero sample is ink, whatever the depth
    cv::Mat gray;
    if (inkMask.channels() == 3) {
        cv::cvtColor(inkMask, gray, cv::COLOR_BGR2GRAY);
    } else if (inkMask.channels() == 4) {
        cv::cvtColor(inkMask, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = inkMask;
    }
    cv::Mat binary = gray != 0;

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    for (const auto& c : contours) {
        BlobRegion blob;
        blob.area = cv::contourArea(c);
        blob.box = cv::boundingRect(c);
        if (isBubbleCandidate(blob)) {
            candidates.push_back(blob);
        }
    }

    log::debug("contours: " + std::to_string(contours.size()) +
               ", bubble candidates: " + std::to_string(candidates.size()));
    return candidates;
}

int BubbleDetector::countFill(const cv::Mat& inkMask, const cv::Rect& box) const {
    cv::Rect safe = box & cv::Rect(0, 0, inkMask.cols, inkMask.rows);
    if (safe.area() <= 0) return 0;

    cv::Mat roi = inkMask(safe);
    if (roi.channels() != 1) {
        cv::Mat gray;
        cv::cvtColor(roi, gray, roi.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
        return cv::countNonZero(gray);
    }
    return cv::countNonZero(roi);
}

SheetReading BubbleDetector::detect(const cv::Mat& inkMask) const {
    SheetReading reading;

    std::vector<BlobRegion> blobs = findCandidates(inkMask);
    if (blobs.empty()) {
        log::debug("no bubble candidates found");
        return reading;
    }

    std::stable_sort(blobs.begin(), blobs.end(),
                     [](const BlobRegion& a, const BlobRegion& b) { return a.box.y < b.box.y; });

    std::vector<QuestionRow> rows = clusterRows(blobs, config_.rowTolerance);

    for (size_t r = 0; r < rows.size(); ++r) {
        QuestionRow& row = rows[r];
        std::stable_sort(row.begin(), row.end(),
                         [](const BlobRegion& a, const BlobRegion& b) { return a.box.x < b.box.x; });

        const int questionNumber = static_cast<int>(r) + 1;
        if (row.size() > kMaxOptions) {
            log::warn("question " + std::to_string(questionNumber) + ": " + std::to_string(row.size()) +
                      " bubbles in one row, only the leftmost " + std::to_string(kMaxOptions) + " are lettered");
            row.resize(kMaxOptions);
        }

        std::vector<int> fills;
        fills.reserve(row.size());
        auto& coords = reading.coordinates[questionNumber];

        for (size_t c = 0; c < row.size(); ++c) {
            const char option = static_cast<char>('A' + c);
            coords[option] = row[c].box;
            fills.push_back(countFill(inkMask, row[c].box));
        }

        int chosen = chooseOption(fills, config_.minFill);
        if (chosen >= 0) {
            reading.answers.setAnswer(questionNumber, std::string(1, static_cast<char>('A' + chosen)));
        } else {
            reading.answers.setAnswer(questionNumber, AnswerKey::kUnanswered);
        }
    }

    reading.status = DetectionStatus::Detected;
    reading.questionCount = static_cast<int>(rows.size());

    log::debug("rows: " + std::to_string(reading.questionCount));
    return reading;
}

void BubbleDetector::drawBubbleDebug(cv::Mat& debugImg, const SheetReading& reading) const {
    if (debugImg.empty()) return;
    if (debugImg.channels() == 1) {
        cv::cvtColor(debugImg, debugImg, cv::COLOR_GRAY2BGR);
    }

    for (const auto& [question, options] : reading.coordinates) {
        const std::string answer = reading.answers.answerFor(question);
        int left = debugImg.cols;
        int top = 0;

        for (const auto& [option, box] : options) {
            bool selected = answer.size() == 1 && answer[0] == option;
            cv::Scalar color = selected ? cv::Scalar(0, 255, 0) : cv::Scalar(100, 100, 100);
            cv::rectangle(debugImg, box, color, selected ? 2 : 1);
            if (box.x < left) {
                left = box.x;
                top = box.y;
            }
        }

        cv::putText(debugImg, std::to_string(question),
                    cv::Point(std::max(0, left - 30), top + 15),
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 0, 255), 1);
    }
}

}
