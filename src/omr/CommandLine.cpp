#include "omr/CommandLine.hpp"
#include "omr/SheetSource.hpp"

#include <ostream>
#include <stdexcept>

namespace omr {

void printUsage(std::ostream& out) {
    out << "Usage: omr_grade [options] STUDENT_SHEET [KEY_SHEET]\n"
        << "  --name NAME          student name for the report (default: Student)\n"
        << "  --report-dir DIR     where annotated reports go (default: reports)\n"
        << "  --no-report          write no report and no debug overlay\n"
        << "  --strict-empty       fail when the student sheet has no bubbles\n"
        << "  --min-area N         smallest bubble contour area (default 500)\n"
        << "  --max-area N         largest bubble contour area (default 5000)\n"
        << "  --row-tolerance N    vertical row grouping tolerance (default 20)\n"
        << "  --min-fill N         ink pixels needed to count as marked (default 50)\n"
        << "  --dpi N              PDF rasterization resolution (default 200)\n"
        << "  --debug              verbose diagnostics, saves detection overlays to the report dir\n"
        << "Sheets: PNG, JPG, JPEG or PDF (first page).\n";
}

bool parseGradeOptions(const std::vector<std::string>& args, GradeOptions& opt, std::ostream& err) {
    std::vector<std::string> inputs;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                err << "Missing value for " << a << "\n";
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        try {
            if (a == "--name") {
                if (!next(opt.studentName)) return false;
            } else if (a == "--report-dir") {
                if (!next(opt.reportDir)) return false;
            } else if (a == "--no-report") {
                opt.writeReport = false;
            } else if (a == "--strict-empty") {
                opt.policy.emptyStudentSheet = GradingPolicy::EmptyStudentSheet::Reject;
            } else if (a == "--debug") {
                opt.debug = true;
            } else if (a == "--min-area") {
                if (!next(value)) return false;
                opt.detector.minArea = std::stod(value);
            } else if (a == "--max-area") {
                if (!next(value)) return false;
                opt.detector.maxArea = std::stod(value);
            } else if (a == "--row-tolerance") {
                if (!next(value)) return false;
                opt.detector.rowTolerance = std::stoi(value);
            } else if (a == "--min-fill") {
                if (!next(value)) return false;
                opt.detector.minFill = std::stoi(value);
            } else if (a == "--dpi") {
                if (!next(value)) return false;
                opt.loader.pdfDpi = std::stod(value);
            } else if (a == "-h" || a == "--help") {
                return false;
            } else if (a.rfind("--", 0) == 0) {
                err << "Unknown option: " << a << "\n";
                return false;
            } else {
                inputs.push_back(a);
            }
        } catch (const std::logic_error&) {
            err << "Invalid number for " << a << ": " << value << "\n";
            return false;
        }
    }

    if (inputs.empty() || inputs.size() > 2) return false;
    opt.studentPath = inputs[0];
    if (inputs.size() == 2) opt.keyPath = inputs[1];

    for (const auto& path : inputs) {
        if (!isSupportedSheetFile(path)) {
            err << "Invalid file type: " << path
                << ". Only PNG, JPG, JPEG, and PDF are allowed.\n";
            return false;
        }
    }
    return true;
}

}
