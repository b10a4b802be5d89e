#include <vector>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "logger.h"

using MkToken::Logger;

std::shared_ptr<Logger> Logger::logger;
std::recursive_mutex Logger::loggerMutex;

Logger::Logger(const LogSettings &settings) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // rotates at midnight, keeps 10 files
        if (!settings.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(settings.file, 0, 0, false, 10));
        }
        if (settings.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        spdLogger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
        spdLogger->set_level(spdlog::level::from_str(settings.level));
        spdLogger->set_pattern("%Y-%m-%d %H:%M:%S.%f:[%t] %l: %v");
        spdLogger->flush_on(spdlog::level::warn);

        spdlog::drop(loggerName);
        spdlog::register_logger(spdLogger);
    } catch (const spdlog::spdlog_ex &e) {
        std::cout << "Logger initialize error: " << e.what() << std::endl;
        spdLogger.reset();
    }
}

Logger::~Logger() {
    if (spdLogger) {
        spdLogger->flush();
        // a newer Logger may have taken the name already
        if (spdlog::get(loggerName) == spdLogger) spdlog::drop(loggerName);
    }
}

std::shared_ptr<Logger> Logger::InitializeLogger(const LogSettings &settings) {
    return std::make_shared<Logger>(settings);
}

void Logger::UnInitializeLogger(std::shared_ptr<Logger> &l) {
    l.reset();
}

void Logger::Write(spdlog::level::level_enum level, const std::string &msg) {
    if (spdLogger) {
        spdLogger->log(level, msg);
    } else if (level >= spdlog::level::warn) {
        std::cout << msg << std::endl;
    }
}
