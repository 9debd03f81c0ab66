#pragma once
#include "config.hpp"
#include <string>

// Installs the process-wide spdlog logger: colored stdout plus a rotating
// file. Falls back to stdout only when the log file cannot be opened.
void init_logging(const std::string& name, const LogConfig& cfg);
