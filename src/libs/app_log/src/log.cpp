#include <app_log/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <system_error>

namespace app_log {

namespace {

const char* const logger_name = "quadrant";

std::shared_ptr<spdlog::logger>& current() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> init(const std::string& file_path, spdlog::level::level_enum level) {
    auto& logger = current();
    if (logger && logger->name() == logger_name) {
        spdlog::drop(logger_name);
    }
    logger.reset();

    try {
        const std::filesystem::path log_file(file_path);
        if (log_file.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(log_file.parent_path(), ec);
        }
        logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        logger = spdlog::default_logger();
        logger->warn("log file {} unavailable ({}), logging to console", file_path, ex.what());
    }
    logger->set_level(level);
    logger->info("Logger initialized. file={} level={}", file_path,
        spdlog::level::to_string_view(level));
    return logger;
}

std::shared_ptr<spdlog::logger> logger() {
    const auto& logger = current();
    if (logger) return logger;
    return spdlog::default_logger();
}

bool parse_level(const std::string& text, spdlog::level::level_enum& out) {
    static const struct {
        const char* name;
        spdlog::level::level_enum level;
    } levels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& entry : levels) {
        if (text == entry.name) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

} // namespace app_log
