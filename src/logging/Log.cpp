#include "logging/Log.hpp"
#include <iostream>

namespace logging {

static bool g_verbose = false;

void set_verbose(bool on) { g_verbose = on; }
bool verbose() { return g_verbose; }

void info(const std::string& component, const std::string& msg) {
    if (!g_verbose) return;
    std::cerr << component << ": " << msg << "\n";
}

void error(const std::string& component, const std::string& msg) {
    std::cerr << component << ": error: " << msg << "\n";
}

}  // namespace logging
