#ifndef OMR_COMMAND_LINE_HPP
#define OMR_COMMAND_LINE_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include "omr/BubbleDetector.hpp"
#include "omr/ImageLoader.hpp"
#include "omr/ScoreCalculator.hpp"

namespace omr {

// omr_grade options
struct GradeOptions {
    std::string studentPath;
    std::string keyPath;
    std::string studentName = "Student";
    std::string reportDir = "reports";
    bool writeReport = true;
    bool debug = false;
    LoaderConfig loader;
    DetectorConfig detector;
    GradingPolicy policy;

    // Debug overlays go next to the reports, so --no-report suppresses them too
    bool writesDebugOverlay() const { return debug && writeReport; }
};

void printUsage(std::ostream& out);

// Parses argv without the program name. Returns false on a usage error, after
// writing the reason (if any) to `err`.
bool parseGradeOptions(const std::vector<std::string>& args, GradeOptions& opt, std::ostream& err);

}

#endif // OMR_COMMAND_LINE_HPP
