#pragma once

#include <memsize-cli/config.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace MemSize::Cli
{
    constexpr static auto ExitSuccess = 0;
    constexpr static auto ExitInvalidSize = 1;
    constexpr static auto ExitInvalidOptions = 2;

    /**
     * Parses and adds up the given sizes, writes the total to out and, with a budget,
     * the remaining headroom. Exceeding the budget is logged as a warning.
     *
     * @return ExitSuccess, or ExitInvalidSize if a size does not parse or the total overflows.
     */
    int summarize(std::vector<std::string> const& sizes, Config const& config, std::ostream& out);
}
