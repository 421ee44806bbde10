#pragma once

#include <optional>
#include <string>
#include <vector>

namespace MemSize::Cli
{
    struct ProgramOptions
    {
        std::vector<std::string> sizes;
        std::optional<std::string> configPath;
        std::optional<std::string> budget;
        std::optional<unsigned> decimalPlaces;
        bool binary = false;
        bool saveConfig = false;
        bool verbose = false;
        bool help = false;
        std::string helpText;
    };

    ProgramOptions parseProgramOptions(int argc, char const* const* argv);
}
