#pragma once

#include <filesystem>
#include <string>

namespace MemSize::Cli
{
    void setupHome();
    std::filesystem::path getHomePath();
    std::string loadFile(std::filesystem::path const& path);
    void saveFile(std::filesystem::path const& path, std::string const& data);
} // namespace MemSize::Cli
