#ifndef OMR_LOG_HPP
#define OMR_LOG_HPP

#include <iostream>
#include <string>

namespace omr::log {

inline bool g_debug = false;

inline void setDebug(bool enabled) { g_debug = enabled; }

inline void debug(const std::string& msg) {
    if (g_debug)
        std::cerr << "[omr][debug] " << msg << "\n";
}
inline void info(const std::string& msg)  { std::cerr << "[omr][info] " << msg << "\n"; }
inline void warn(const std::string& msg)  { std::cerr << "[omr][warn] " << msg << "\n"; }
inline void error(const std::string& msg) { std::cerr << "[omr][error] " << msg << "\n"; }

}

#endif // OMR_LOG_HPP
