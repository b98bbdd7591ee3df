#include "mm/fix/fix_cli.hpp"

#include "mm/app_info.hpp"
#include "mm/fix/fix_options.hpp"
#include "mm/repair/sanitizer.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace mm::fix
{
namespace
{
constexpr std::string_view kToolId = "mm-fix";

const appinfo::ToolInfo &toolInfo()
{
    return appinfo::requireTool(kToolId);
}

bool readAll(std::istream &in, std::string &contents)
{
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return false;
    contents = buffer.str();
    return true;
}

bool readFile(const std::filesystem::path &path, std::string &contents)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
        return false;
    return readAll(in, contents);
}

bool writeFile(const std::filesystem::path &path, const std::string &contents)
{
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out)
        return false;
    out << contents;
    out.flush();
    return static_cast<bool>(out);
}

std::string displayName(const CliOptions &options)
{
    return options.input ? options.input->string() : std::string("<stdin>");
}

} // namespace

ParseOutcome parseArguments(const std::vector<std::string> &args)
{
    ParseOutcome outcome;
    CliOptions &opts = outcome.options;

    auto requireValue = [&](std::size_t &index, const std::string &flag) -> std::optional<std::string> {
        if (index + 1 >= args.size())
        {
            outcome.error = flag + " requires a value";
            return std::nullopt;
        }
        return args[++index];
    };

    for (std::size_t i = 0; i < args.size() && outcome.ok(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--help" || arg == "-h")
            opts.showHelp = true;
        else if (arg == "--version")
            opts.showVersion = true;
        else if (arg == "--show-options")
            opts.showOptions = true;
        else if (arg == "--check")
            opts.check = true;
        else if (arg == "--in-place" || arg == "-i")
            opts.inPlace = true;
        else if (arg == "--report")
            opts.report = true;
        else if (arg == "--json")
        {
            opts.report = true;
            opts.reportFormat = "json";
        }
        else if (arg == "--verbose" || arg == "-v")
            opts.verbose = true;
        else if (arg == "--disable")
            opts.enabled = false;
        else if (arg == "--enable")
            opts.enabled = true;
        else if (arg == "--save-defaults")
            opts.saveDefaults = true;
        else if (arg == "--output" || arg == "-o")
        {
            if (auto value = requireValue(i, arg))
                opts.output = *value;
        }
        else if (arg == "--load-options")
        {
            if (auto value = requireValue(i, arg))
                opts.optionsFile = *value;
        }
        else if (arg == "--report-format")
        {
            if (auto value = requireValue(i, arg))
                opts.reportFormat = *value;
        }
        else if (arg == "--extra-node-triggers")
        {
            if (auto value = requireValue(i, arg))
                opts.extraNodeTriggers = *value;
        }
        else if (arg == "--extra-edge-triggers")
        {
            if (auto value = requireValue(i, arg))
                opts.extraEdgeTriggers = *value;
        }
        else if (arg == "-")
        {
            if (opts.input)
                outcome.error = "only one input file may be given";
        }
        else if (!arg.empty() && arg.front() == '-')
            outcome.error = "unknown option '" + arg + "'";
        else if (opts.input)
            outcome.error = "only one input file may be given";
        else
            opts.input = arg;
    }

    if (outcome.ok() && opts.inPlace && !opts.input)
        outcome.error = "--in-place requires an input file";
    if (outcome.ok() && opts.inPlace && opts.output)
        outcome.error = "--in-place cannot be combined with --output";
    return outcome;
}

bool applyCliOverrides(config::OptionRegistry &registry, const CliOptions &options, std::string &error)
{
    if (options.enabled && !registry.set(kOptionEnabled, config::OptionValue(*options.enabled)))
        error = "cannot apply --enable/--disable";
    else if (options.extraNodeTriggers &&
             !registry.set(kOptionExtraNodeTriggers, config::OptionValue(*options.extraNodeTriggers)))
        error = "invalid node trigger characters '" + *options.extraNodeTriggers + "'";
    else if (options.extraEdgeTriggers &&
             !registry.set(kOptionExtraEdgeTriggers, config::OptionValue(*options.extraEdgeTriggers)))
        error = "invalid edge trigger characters '" + *options.extraEdgeTriggers + "'";
    else if (options.reportFormat && !registry.set(kOptionReportFormat, config::OptionValue(*options.reportFormat)))
        error = "invalid report format '" + *options.reportFormat + "' (expected text or json)";
    else
        return true;
    return false;
}

std::string renderTextReport(const repair::SanitizeResult &result, const std::string &sourceName)
{
    std::ostringstream out;
    out << sourceName << ": " << repair::statusName(result.status);
    if (result.fixed())
        out << " (" << result.repairs.size() << (result.repairs.size() == 1 ? " repair)" : " repairs)");
    out << "\n";
    for (const auto &record : result.repairs)
        out << "  line " << record.line << ": " << repair::ruleName(record.rule) << "\n";
    return out.str();
}

nlohmann::json renderJsonReport(const repair::SanitizeResult &result)
{
    nlohmann::json report = nlohmann::json::object();
    report["status"] = std::string(repair::statusName(result.status));
    nlohmann::json repairs = nlohmann::json::array();
    for (const auto &record : result.repairs)
        repairs.push_back({{"rule", std::string(repair::ruleName(record.rule))}, {"line", record.line}});
    report["repairs"] = std::move(repairs);
    report["text"] = result.text;
    return report;
}

void printUsage(std::ostream &out)
{
    const auto &info = toolInfo();
    out << info.executable << " - " << info.shortDescription << "\n\n"
        << "Usage: " << info.usageSummary << "\n"
        << "  FILE                         Diagram source to repair (stdin when omitted or '-')\n"
        << "  -o, --output FILE            Write the result to FILE instead of stdout\n"
        << "  -i, --in-place               Rewrite FILE when a repair was made\n"
        << "  --check                      Exit 1 when the diagram needs repairs, 0 otherwise\n"
        << "  --report                     Describe the repairs (text on stderr, json on stdout)\n"
        << "  --json                       Same as --report --report-format json\n"
        << "  --report-format FORMAT       text or json\n"
        << "  --extra-node-triggers CHARS  Additional characters that force node label quoting\n"
        << "  --extra-edge-triggers CHARS  Additional characters that force edge label quoting\n"
        << "  --disable, --enable          Turn repairs off or on for this run\n"
        << "  --load-options FILE          Read options from FILE instead of saved defaults\n"
        << "  --save-defaults              Persist the effective options as defaults\n"
        << "  --show-options               Print the effective options and exit\n"
        << "  -v, --verbose                Log a notice when the diagram was auto-fixed\n"
        << "  --version                    Print the version and exit\n"
        << "  -h, --help                   Show this help message\n"
        << "\nOptions can also be set with MM_FIX_ENABLED, MM_FIX_EXTRA_NODE_TRIGGERS,\n"
        << "MM_FIX_EXTRA_EDGE_TRIGGERS and MM_FIX_REPORT_FORMAT." << std::endl;
}

void printOptions(const config::OptionRegistry &registry, std::ostream &out)
{
    for (const auto &option : registry.resolvedOptions())
    {
        out << option.definition->key << " = ";
        if (option.definition->kind == config::OptionKind::Boolean)
            out << (option.value.toBool() ? "true" : "false");
        else
            out << '"' << option.value.toString() << '"';
        out << "  (" << config::sourceName(option.source) << ")" << std::endl;
    }
}

int runFix(const CliOptions &options, const config::OptionRegistry &registry, std::istream &in, std::ostream &out,
           std::ostream &err)
{
    const std::string sourceName = displayName(options);
    std::string source;
    bool readOk = options.input ? readFile(*options.input, source) : readAll(in, source);
    if (!readOk)
    {
        err << kToolId << ": cannot read '" << sourceName << "'" << std::endl;
        return 2;
    }

    repair::SanitizeResult result = repair::sanitize(source, sanitizerOptionsFrom(registry));
    if (options.verbose && result.fixed())
        err << kToolId << ": " << sourceName << ": syntax auto-fixed (" << result.repairs.size() << " repairs)"
            << std::endl;

    const bool jsonReport = options.report && registry.getString(kOptionReportFormat) == "json";
    if (options.report && !jsonReport)
        err << renderTextReport(result, sourceName);
    if (jsonReport)
        out << renderJsonReport(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

    if (options.check)
        return result.fixed() ? 1 : 0;

    if (options.inPlace)
    {
        if (result.fixed() && !writeFile(*options.input, result.text))
        {
            err << kToolId << ": cannot write '" << sourceName << "'" << std::endl;
            return 2;
        }
        return 0;
    }
    if (options.output)
    {
        if (!writeFile(*options.output, result.text))
        {
            err << kToolId << ": cannot write '" << options.output->string() << "'" << std::endl;
            return 2;
        }
        return 0;
    }
    if (!jsonReport)
        out << result.text;
    return out ? 0 : 2;
}

} // namespace mm::fix
