#include <memsize-cli/load_home_file.hpp>

#include <roar/filesystem/special_paths.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace MemSize::Cli
{
    std::string loadFile(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            throw std::runtime_error("Cannot load file "s + path.string());
        std::stringstream sstr;
        sstr << reader.rdbuf();
        return sstr.str();
    }
    void saveFile(std::filesystem::path const& path, std::string const& data)
    {
        std::ofstream writer{path, std::ios_base::binary};
        if (!writer.good())
            throw std::runtime_error("Cannot open file for writing "s + path.string());
        writer.write(data.c_str(), static_cast<std::streamsize>(data.size()));
    }
    std::filesystem::path getHomePath()
    {
        return Roar::resolvePath("~/.memsize");
    }
    void setupHome()
    {
        const auto homePath = getHomePath();
        if (!std::filesystem::exists(homePath))
            std::filesystem::create_directories(homePath);
    }
} // namespace MemSize::Cli
