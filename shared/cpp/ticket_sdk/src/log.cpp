#include "../include/log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

void init_logging(const std::string& name, const LogConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    try {
        auto parent = std::filesystem::path(cfg.file).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, cfg.max_bytes, cfg.max_files));
    } catch (const std::exception& e) {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");
    logger->set_level(spdlog::level::from_str(cfg.level));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    if (!file_error.empty()) {
        spdlog::warn("log file {} unavailable ({}); logging to stdout only", cfg.file, file_error);
    } else {
        spdlog::info("Logging to {} (max {}MB x {} files)", cfg.file, cfg.max_bytes / (1024 * 1024), cfg.max_files);
    }
}
