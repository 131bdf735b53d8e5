#pragma once
#include <string>

// stderr diagnostics; stdout carries the JSON result only
namespace logging {

void set_verbose(bool on);
bool verbose();

// "<component>: <msg>", printed only with --verbose
void info(const std::string& component, const std::string& msg);

// "<component>: error: <msg>", always printed
void error(const std::string& component, const std::string& msg);

}  // namespace logging
