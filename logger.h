#pragma once
#include <memory>
#include <mutex>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

#include "config.h"

namespace MkToken {

    class Logger {
        static std::shared_ptr<Logger> InitializeLogger(const LogSettings &settings);
        static void UnInitializeLogger(std::shared_ptr<Logger> &l);

        static std::shared_ptr<Logger> logger;
        static std::recursive_mutex loggerMutex;
        std::shared_ptr<spdlog::logger> spdLogger;

    public:
        static constexpr const char *loggerName = "mktoken";

        explicit Logger(const LogSettings &settings);
        ~Logger();

        void Write(spdlog::level::level_enum level, const std::string &msg);

        static std::shared_ptr<Logger> Initialize(const Config &config) {
            std::lock_guard _lock(loggerMutex);
            return logger = InitializeLogger(config.logging);
        }

        static void UnInitialize() {
            std::lock_guard _lock(loggerMutex);
            UnInitializeLogger(logger);
        }

        // without an active logger, warnings and errors still reach stdout
        static void logMessage(spdlog::level::level_enum level, const std::string &m) {
            std::lock_guard _lock(loggerMutex);
            if (logger) {
                logger->Write(level, m);
            } else if (level >= spdlog::level::warn) {
                std::cout << m << std::endl;
            }
        }

        static bool IsLogActive() {
            std::lock_guard _lock(loggerMutex);
            return logger != nullptr;
        }
    };
}
