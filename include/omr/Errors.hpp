#ifndef OMR_ERRORS_HPP
#define OMR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace omr {

// Sheet could not be read, decoded or rasterized.
class LoadError : public std::runtime_error {
public:
    explicit LoadError(const std::string& what) : std::runtime_error(what) {}
};

// Grading cannot proceed with the sheets given (e.g. key without questions).
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class ReportError : public std::runtime_error {
public:
    explicit ReportError(const std::string& what) : std::runtime_error(what) {}
};

}

#endif // OMR_ERRORS_HPP
