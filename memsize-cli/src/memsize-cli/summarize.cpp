#include <memsize-cli/summarize.hpp>
#include <memsizepp/format.hpp>
#include <memsizepp/parse.hpp>

#include <boost/leaf.hpp>

#include <spdlog/spdlog.h>

namespace leaf = boost::leaf;

namespace MemSize::Cli
{
    //#####################################################################################################################
    int summarize(std::vector<std::string> const& sizes, Config const& config, std::ostream& out)
    {
        return leaf::try_handle_all(
            [&]() -> leaf::result<int> {
                std::vector<MemorySize> parsed;
                parsed.reserve(sizes.size());
                for (auto const& text : sizes)
                {
                    BOOST_LEAF_AUTO(size, parseMemorySize(text));
                    spdlog::debug("'{}' is {} bit", text, size.bits());
                    parsed.push_back(size);
                }

                BOOST_LEAF_AUTO(total, checkedSum(parsed));
                out << total.toString(config.format) << '\n';

                if (config.budget)
                {
                    if (total > *config.budget)
                    {
                        BOOST_LEAF_AUTO(overshoot, checkedSubtract(total, *config.budget));
                        spdlog::warn(
                            "Total exceeds the budget of {} by {}",
                            config.budget->toString(config.format),
                            overshoot.toString(config.format));
                    }
                    else
                    {
                        BOOST_LEAF_AUTO(headroom, checkedSubtract(*config.budget, total));
                        out << headroom.toString(config.format) << " left of "
                            << config.budget->toString(config.format) << '\n';
                    }
                }
                return ExitSuccess;
            },
            [](ArithmeticError error, e_size_text const& text) {
                spdlog::error("Cannot represent '{}': {}", text.value, toString(error));
                return ExitInvalidSize;
            },
            [](ParseError error, e_size_text const& text) {
                spdlog::error("Cannot parse '{}': {}", text.value, toString(error));
                return ExitInvalidSize;
            },
            [](ArithmeticError error) {
                spdlog::error("The total is not representable: {}", toString(error));
                return ExitInvalidSize;
            },
            []() {
                spdlog::error("Unexpected failure while adding up sizes.");
                return ExitInvalidSize;
            });
    }
    //#####################################################################################################################
}
