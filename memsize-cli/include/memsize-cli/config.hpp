#pragma once

#include <memsize-cli/program_options.hpp>
#include <memsizepp/json.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace MemSize::Cli
{
    struct Config
    {
        FormatOptions format;
        std::optional<MemorySize> budget;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, format, budget)

    std::filesystem::path defaultConfigPath();
    Config parseConfig(std::string_view text);

    enum class MissingFile
    {
        Fail,
        UseDefaults
    };

    /**
     * Loads the given file, or the default configuration file if no path is given.
     * A missing default file or an unresolvable home directory yields the built-in defaults.
     * A missing explicit file throws, unless missingFile is UseDefaults.
     */
    Config loadConfig(
        std::optional<std::filesystem::path> const& path,
        MissingFile missingFile = MissingFile::Fail);
    void saveConfig(Config const& config, std::filesystem::path const& path);

    /**
     * Applies command line overrides.
     * @throws std::invalid_argument for a malformed budget or too many decimal places.
     */
    Config withOverrides(Config config, ProgramOptions const& options);
}
