#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "config.h"
#include "errors.h"
#include "logger.h"

using MkToken::Config;

const Config &Config::Default() {
    static const Config config {};
    return config;
}

static char ToZone(const nlohmann::json &j) {
    if (!j.is_string() || j.get<std::string>().length() != 1) {
        throw MkToken::ConfigError(fmt::format("Zone {} should be a single char string", j.dump()));
    }
    return j.get<std::string>()[0];
}

Config Config::FromJson(const std::string &text) {
    Config config;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) throw ConfigError("Config root should be a JSON object");

        if (j.contains("zones")) {
            config.zones.clear();
            for (const auto &z : j.at("zones")) config.zones.push_back(ToZone(z));
        }
        if (j.contains("defaultZone")) config.defaultZone = ToZone(j.at("defaultZone"));
        if (j.contains("logging")) {
            const auto &l = j.at("logging");
            config.logging.level = l.value("level", config.logging.level);
            config.logging.file = l.value("file", config.logging.file);
            config.logging.console = l.value("console", config.logging.console);
        }
    } catch (const nlohmann::json::exception &e) {
        throw ConfigError(fmt::format("JSON config error: {}", e.what()));
    }
    config.Validate();
    return config;
}

Config Config::Load(const std::string &fileName) {
    std::ifstream in(fileName);
    if (!in) throw ConfigError(fmt::format("Cannot open config file {}", fileName));

    std::stringstream ss;
    ss << in.rdbuf();
    auto config = FromJson(ss.str());
    Logger::logMessage(spdlog::level::info,
                       fmt::format("Loaded config {} with zones [{}]", fileName, config.ZoneList()));
    return config;
}

bool Config::HasZone(char zone) const {
    auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(zone)));
    return std::find(zones.begin(), zones.end(), lower) != zones.end();
}

void Config::Validate() const {
    if (zones.empty()) throw ConfigError("At least one marketplace zone is expected");
    for (auto z : zones) {
        if (z < 'a' || z > 'z') {
            throw ConfigError(fmt::format("Zone '{}' should be a lowercase letter", z));
        }
    }
    if (std::find(zones.begin(), zones.end(), defaultZone) == zones.end()) {
        throw ConfigError(fmt::format("Default zone '{}' is not in [{}]", defaultZone, ZoneList()));
    }
    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off") {
        throw ConfigError(fmt::format("Unknown log level {}", logging.level));
    }
}
