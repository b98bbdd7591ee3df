#include "mm/app_info.hpp"
#include "mm/fix/fix_cli.hpp"
#include "mm/fix/fix_options.hpp"
#include "mm/options.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#ifndef MM_FIX_VERSION
#define MM_FIX_VERSION "0.0.0"
#endif

namespace config = mm::config;

namespace
{

constexpr std::string_view kToolId = "mm-fix";

bool prepareRegistry(config::OptionRegistry &registry, const mm::fix::CliOptions &opts)
{
    mm::fix::registerFixOptions(registry);
    if (opts.optionsFile)
    {
        if (!registry.loadFromFile(*opts.optionsFile))
        {
            std::cerr << kToolId << ": failed to load options from '" << opts.optionsFile->string() << "'"
                      << std::endl;
            return false;
        }
    }
    else
    {
        std::error_code ec;
        const auto defaults = registry.defaultOptionsPath();
        if (std::filesystem::exists(defaults, ec) && !registry.loadDefaults())
            std::cerr << kToolId << ": ignoring unreadable defaults at " << defaults << std::endl;
    }
    registry.loadFromEnvironment(mm::fix::kEnvironmentPrefix);

    std::string error;
    if (!mm::fix::applyCliOverrides(registry, opts, error))
    {
        std::cerr << kToolId << ": " << error << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = mm::fix::parseArguments(args);
    if (!parsed.ok())
    {
        std::cerr << kToolId << ": " << parsed.error << std::endl;
        mm::fix::printUsage(std::cerr);
        return 2;
    }
    const mm::fix::CliOptions &opts = parsed.options;

    if (opts.showHelp)
    {
        mm::fix::printUsage(std::cout);
        return 0;
    }
    if (opts.showVersion)
    {
        std::cout << kToolId << " " << MM_FIX_VERSION << std::endl;
        return 0;
    }

    try
    {
        config::OptionRegistry registry{std::string(mm::appinfo::requireTool(kToolId).id)};
        if (!prepareRegistry(registry, opts))
            return 2;

        if (opts.saveDefaults && !registry.saveDefaults())
        {
            std::cerr << kToolId << ": failed to save defaults to " << registry.defaultOptionsPath() << std::endl;
            return 2;
        }
        if (opts.showOptions)
        {
            mm::fix::printOptions(registry, std::cout);
            return 0;
        }
        return mm::fix::runFix(opts, registry, std::cin, std::cout, std::cerr);
    }
    catch (const std::exception &ex)
    {
        std::cerr << kToolId << ": " << ex.what() << std::endl;
        return 2;
    }
}
