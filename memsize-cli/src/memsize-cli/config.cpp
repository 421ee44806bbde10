#include <memsize-cli/config.hpp>
#include <memsize-cli/load_home_file.hpp>
#include <memsizepp/parse.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

using namespace std::literals;

namespace MemSize::Cli
{
    namespace detail
    {
#ifdef NDEBUG
        constexpr static auto inDev = false;
#else
        constexpr static auto inDev = true;
#endif
    }

    std::filesystem::path defaultConfigPath()
    {
        return getHomePath() / (detail::inDev ? "configDev.json" : "config.json");
    }
    Config parseConfig(std::string_view text)
    {
        auto config = json::parse(text).get<Config>();
        if (config.format.decimalPlaces > MaxDecimalPlaces)
            throw std::invalid_argument(
                "Configured decimalPlaces must not exceed "s + std::to_string(MaxDecimalPlaces));
        return config;
    }
    Config loadConfig(std::optional<std::filesystem::path> const& path, MissingFile missingFile)
    {
        if (path)
        {
            if (missingFile == MissingFile::UseDefaults && !std::filesystem::exists(*path))
            {
                spdlog::info("No configuration at '{}' yet, starting from defaults.", path->string());
                return {};
            }
            return parseConfig(loadFile(*path));
        }

        std::filesystem::path defaultPath;
        try
        {
            defaultPath = defaultConfigPath();
        }
        catch (std::exception const& exc)
        {
            spdlog::info("Cannot locate the home directory ({}), using defaults.", exc.what());
            return {};
        }
        if (!std::filesystem::exists(defaultPath))
        {
            spdlog::info("No configuration at '{}', using defaults.", defaultPath.string());
            return {};
        }
        spdlog::info("Loading configuration from '{}'", defaultPath.string());
        return parseConfig(loadFile(defaultPath));
    }
    void saveConfig(Config const& config, std::filesystem::path const& path)
    {
        saveFile(path, json(config).dump(4));
    }
    Config withOverrides(Config config, ProgramOptions const& options)
    {
        if (options.binary)
            config.format.units = UnitSystem::Binary;
        if (options.decimalPlaces)
        {
            if (*options.decimalPlaces > MaxDecimalPlaces)
                throw std::invalid_argument(
                    "--decimals must not exceed "s + std::to_string(MaxDecimalPlaces));
            config.format.decimalPlaces = *options.decimalPlaces;
        }
        if (options.budget)
        {
            auto budget = parseMemorySize(*options.budget);
            if (!budget)
                throw std::invalid_argument("'"s + *options.budget + "' is not a valid budget.");
            config.budget = *budget;
        }
        return config;
    }
}
