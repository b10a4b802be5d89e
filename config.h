#pragma once
#include <string>
#include <vector>

namespace MkToken {

    struct LogSettings {
        std::string level {"info"};
        std::string file;   // empty -> no file sink
        bool console {true};
    };

    // Built once at startup and shared by const reference.
    // Token widths and offsets are not part of it: changing them breaks issued tokens.
    struct Config {
        // lowercase single-char marketplace zones, mapping to server regions
        std::vector<char> zones {'e', 's'};
        char defaultZone {'e'};
        LogSettings logging;

        static const Config &Default();
        static Config FromJson(const std::string &text);
        static Config Load(const std::string &fileName);

        // case insensitive
        bool HasZone(char zone) const;
        std::string ZoneList() const { return std::string(zones.begin(), zones.end()); }

    private:
        void Validate() const;
    };
}
