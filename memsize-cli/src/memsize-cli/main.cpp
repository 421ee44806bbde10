#include <memsize-cli/config.hpp>
#include <memsize-cli/load_home_file.hpp>
#include <memsize-cli/program_options.hpp>
#include <memsize-cli/summarize.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <iostream>
#include <vector>

namespace
{
    int run(int argc, char** argv)
    {
        using namespace MemSize::Cli;

        ProgramOptions programOptions;
        Config config;
        try
        {
            programOptions = parseProgramOptions(argc, argv);
            if (programOptions.help)
            {
                std::cout << programOptions.helpText;
                return ExitSuccess;
            }
            if (programOptions.verbose)
                spdlog::set_level(spdlog::level::debug);

            std::optional<std::filesystem::path> configPath;
            if (programOptions.configPath)
                configPath = *programOptions.configPath;

            // --save-config may create the file it is pointed at.
            const auto missingFile = programOptions.saveConfig ? MissingFile::UseDefaults : MissingFile::Fail;
            config = withOverrides(loadConfig(configPath, missingFile), programOptions);

            if (programOptions.saveConfig)
            {
                if (!configPath)
                    setupHome();
                const auto target = configPath ? *configPath : defaultConfigPath();
                saveConfig(config, target);
                spdlog::info("Configuration written to '{}'", target.string());
            }
        }
        catch (std::exception const& exc)
        {
            spdlog::error("{}", exc.what());
            return ExitInvalidOptions;
        }

        return summarize(programOptions.sizes, config, std::cout);
    }
}

int main(int argc, char** argv)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_st>());
    auto combined_logger = std::make_shared<spdlog::logger>("memsize", begin(sinks), end(sinks));
    spdlog::set_default_logger(combined_logger);
    spdlog::set_level(spdlog::level::info);

    const auto exitCode = run(argc, argv);
    spdlog::shutdown();
    return exitCode;
}
