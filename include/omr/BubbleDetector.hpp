#ifndef OMR_BUBBLE_DETECTOR_HPP
#define OMR_BUBBLE_DETECTOR_HPP

#include <opencv2/core.hpp>
#include <cstddef>
#include <string>
#include <vector>
#include "omr/AnswerKey.hpp"

namespace omr {

struct DetectorConfig {
    double minArea = 500.0;     // bubble contour area range (inclusive)
    double maxArea = 5000.0;
    double minAspect = 0.8;     // width / height range (inclusive)
    double maxAspect = 1.2;
    int rowTolerance = 20;      // max |y - row anchor y| inside one row
    int minFill = 50;           // a winner needs strictly more ink pixels than this
};

struct BlobRegion {
    cv::Rect box;
    double area = 0.0;
};

using QuestionRow = std::vector<BlobRegion>;

// Options are lettered A..Z; blobs right of the 26th in a row are dropped.
constexpr std::size_t kMaxOptions = 26;

enum class DetectionStatus {
    Detected,
    NoBubblesFound
};

// Result of reading one sheet.
struct SheetReading {
    DetectionStatus status = DetectionStatus::NoBubblesFound;
    AnswerKey answers;
    CoordinateMap coordinates;
    int questionCount = 0;

    bool found() const { return status == DetectionStatus::Detected; }
};

// Sequential 1-D clustering of blobs already sorted by top y. A row starts at
// its first blob (the anchor) and takes every following blob whose y lies
// within `tolerance` of the anchor. Order dependent; an approximation, not a
// true clustering.
std::vector<QuestionRow> clusterRows(const std::vector<BlobRegion>& sortedByY, int tolerance);

// Index of the option with the strictly largest fill (leftmost wins ties), or
// -1 when that fill is <= minFill.
int chooseOption(const std::vector<int>& fills, int minFill);

class BubbleDetector {
public:
    explicit BubbleDetector(const DetectorConfig& config = DetectorConfig());

    SheetReading detect(const cv::Mat& inkMask) const;

    // Bubble-shaped external blobs of the mask, unsorted
    std::vector<BlobRegion> findCandidates(const cv::Mat& inkMask) const;

    bool isBubbleCandidate(const BlobRegion& blob) const;

    void setConfig(const DetectorConfig& config) { config_ = config; }
    const DetectorConfig& config() const { return config_; }

    void setFillThreshold(int minFill) { config_.minFill = minFill; }
    int getFillThreshold() const { return config_.minFill; }

    // Draws candidate boxes and row numbers, for --debug output
    void drawBubbleDebug(cv::Mat& debugImg, const SheetReading& reading) const;

private:
    DetectorConfig config_;

    int countFill(const cv::Mat& inkMask, const cv::Rect& box) const;
};

}

#endif // OMR_BUBBLE_DETECTOR_HPP
