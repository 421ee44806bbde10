#include <memsize-cli/program_options.hpp>

#include <cxxopts.hpp>

namespace MemSize::Cli
{
    ProgramOptions parseProgramOptions(int argc, char const* const* argv)
    {
        cxxopts::Options options("memsize", "Adds up memory sizes and prints the total in human readable form.");

        // clang-format off
        options.add_options()
            ("binary", "Format with binary units (KiB, MiB, ...) instead of decimal ones.")
            ("decimals", "Number of decimal places to print.", cxxopts::value<unsigned>())
            ("budget", "Report the headroom left below this size, e.g. '4GiB'.", cxxopts::value<std::string>())
            ("config", "Configuration file, defaults to ~/.memsize/config.json.", cxxopts::value<std::string>())
            ("save-config", "Write the effective configuration back to the configuration file.")
            ("verbose", "Log every parsed size.")
            ("help", "Print this help.")
            ("sizes", "Sizes to add up, e.g. 512 '10 kB' 1.5MiB 12bit.", cxxopts::value<std::vector<std::string>>());
        // clang-format on
        options.parse_positional({"sizes"});
        options.positional_help("<size>...");

        const auto result = options.parse(argc, argv);

        ProgramOptions programOptions{
            .binary = result.count("binary") != 0,
            .saveConfig = result.count("save-config") != 0,
            .verbose = result.count("verbose") != 0,
            .help = result.count("help") != 0,
            .helpText = options.help(),
        };
        if (result.count("sizes") != 0)
            programOptions.sizes = result["sizes"].as<std::vector<std::string>>();
        if (result.count("config") != 0)
            programOptions.configPath = result["config"].as<std::string>();
        if (result.count("budget") != 0)
            programOptions.budget = result["budget"].as<std::string>();
        if (result.count("decimals") != 0)
            programOptions.decimalPlaces = result["decimals"].as<unsigned>();
        return programOptions;
    }
}
