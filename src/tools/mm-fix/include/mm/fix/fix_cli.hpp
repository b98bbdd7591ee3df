#pragma once

#include "mm/options.hpp"
#include "mm/repair/types.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mm::fix
{

struct CliOptions
{
    bool showHelp = false;
    bool showVersion = false;
    bool showOptions = false;
    bool check = false;
    bool inPlace = false;
    bool report = false;
    bool verbose = false;
    bool saveDefaults = false;
    std::optional<std::filesystem::path> input;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> optionsFile;
    std::optional<std::string> reportFormat;
    std::optional<std::string> extraNodeTriggers;
    std::optional<std::string> extraEdgeTriggers;
    std::optional<bool> enabled;
};

struct ParseOutcome
{
    CliOptions options;
    std::string error;

    bool ok() const noexcept { return error.empty(); }
};

// |args| excludes the program name.
ParseOutcome parseArguments(const std::vector<std::string> &args);

// Layers command-line values over whatever the registry already holds.
// Returns false and fills |error| for values the registry rejects.
bool applyCliOverrides(config::OptionRegistry &registry, const CliOptions &options, std::string &error);

std::string renderTextReport(const repair::SanitizeResult &result, const std::string &sourceName);
nlohmann::json renderJsonReport(const repair::SanitizeResult &result);

void printUsage(std::ostream &out);
void printOptions(const config::OptionRegistry &registry, std::ostream &out);

// Reads the diagram, repairs it and writes the result. Exit codes: 0 done
// (or unchanged under --check), 1 repaired under --check, 2 I/O failure.
int runFix(const CliOptions &options, const config::OptionRegistry &registry, std::istream &in, std::ostream &out,
           std::ostream &err);

} // namespace mm::fix
