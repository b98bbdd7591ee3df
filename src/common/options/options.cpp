#include "mm/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mm::config
{
namespace
{
constexpr const char *kConfigDirectoryName = "mermaid-mend";

std::optional<bool> parseSwitch(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::string characterSet(std::string_view text)
{
    std::string result;
    for (char ch : text)
    {
        auto code = static_cast<unsigned char>(ch);
        if (code <= 0x20 || code >= 0x7f || ch == '"')
            continue;
        if (result.find(ch) == std::string::npos)
            result.push_back(ch);
    }
    return result;
}

// JSON -> option value; nullopt when the JSON type does not fit the kind.
std::optional<OptionValue> valueFromJson(OptionKind kind, const nlohmann::json &node)
{
    switch (kind)
    {
    case OptionKind::Boolean:
        if (node.is_boolean())
            return OptionValue(node.get<bool>());
        if (node.is_number_integer())
            return OptionValue(node.get<std::int64_t>() != 0);
        if (node.is_string())
            return OptionValue(node.get<std::string>());
        break;
    case OptionKind::String:
        if (node.is_string())
            return OptionValue(node.get<std::string>());
        break;
    case OptionKind::Characters:
        if (node.is_string())
            return OptionValue(node.get<std::string>());
        if (node.is_array())
        {
            // ["@", "#"] spells the same set as "@#".
            std::string joined;
            for (const auto &item : node)
            {
                if (!item.is_string())
                    return std::nullopt;
                joined += item.get<std::string>();
            }
            return OptionValue(joined);
        }
        break;
    }
    return std::nullopt;
}

nlohmann::json valueToJson(const OptionValue &value)
{
    if (value.isBool())
        return value.toBool();
    if (value.isString())
        return value.toString();
    return nullptr;
}

std::filesystem::path locateConfigRoot()
{
    for (const char *variable : {"XDG_CONFIG_HOME", "HOME"})
    {
        const char *raw = std::getenv(variable);
        if (!raw || !*raw)
            continue;
        std::filesystem::path base(raw);
        if (std::string_view(variable) == "HOME")
            base /= ".config";
        return base / kConfigDirectoryName;
    }
    return std::filesystem::path(".config") / kConfigDirectoryName;
}

} // namespace

std::string_view sourceName(OptionSource source) noexcept
{
    switch (source)
    {
    case OptionSource::Default:
        return "default";
    case OptionSource::File:
        return "file";
    case OptionSource::Environment:
        return "environment";
    case OptionSource::CommandLine:
        return "command line";
    }
    return "default";
}

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::isBool() const noexcept
{
    return std::holds_alternative<bool>(value);
}

bool OptionValue::isString() const noexcept
{
    return std::holds_alternative<std::string>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (const bool *flag = std::get_if<bool>(&value))
        return *flag;
    if (const std::string *text = std::get_if<std::string>(&value))
        return parseSwitch(*text).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (const std::string *text = std::get_if<std::string>(&value))
        return *text;
    if (const bool *flag = std::get_if<bool>(&value))
        return *flag ? "true" : "false";
    return fallback;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(OptionDefinition definition)
{
    std::string key = definition.key;
    definitions.insert_or_assign(key, std::move(definition));
    stored.erase(key);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const noexcept
{
    auto it = definitions.find(key);
    return it == definitions.end() ? nullptr : &it->second;
}

bool OptionRegistry::set(const std::string &key, const OptionValue &value, OptionSource source)
{
    const OptionDefinition *def = definition(key);
    if (!def)
        return false;
    std::optional<OptionValue> accepted = coerce(*def, value);
    if (!accepted)
        return false;
    stored[key] = StoredValue{std::move(*accepted), source};
    return true;
}

void OptionRegistry::reset(const std::string &key)
{
    stored.erase(key);
}

void OptionRegistry::resetToDefaults() noexcept
{
    stored.clear();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    if (auto it = stored.find(key); it != stored.end())
        return it->second.value;
    if (const OptionDefinition *def = definition(key))
        return def->defaultValue;
    return OptionValue();
}

OptionSource OptionRegistry::sourceOf(const std::string &key) const
{
    auto it = stored.find(key);
    return it == stored.end() ? OptionSource::Default : it->second.source;
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

std::vector<ResolvedOption> OptionRegistry::resolvedOptions() const
{
    std::vector<ResolvedOption> result;
    result.reserve(definitions.size());
    for (const auto &[key, def] : definitions)
        result.push_back(ResolvedOption{&def, get(key), sourceOf(key)});
    return result;
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    const nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object())
        return false;

    for (const auto &[key, def] : definitions)
    {
        auto it = document.find(key);
        if (it == document.end())
            continue;
        std::optional<OptionValue> value = valueFromJson(def.kind, *it);
        // Rejected entries keep whatever value the option already had.
        if (!value || !set(key, *value, OptionSource::File))
            continue;
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json document = nlohmann::json::object();
    for (const auto &[key, def] : definitions)
        document[key] = valueToJson(get(key));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath, std::ios::out | std::ios::trunc);
    if (!out)
        return false;
    out << document.dump(2) << '\n';
    return static_cast<bool>(out);
}

std::size_t OptionRegistry::loadFromEnvironment(const std::string &prefix)
{
    std::size_t applied = 0;
    for (const auto &[key, def] : definitions)
    {
        const char *raw = std::getenv(environmentName(prefix, key).c_str());
        if (raw && set(key, OptionValue(raw), OptionSource::Environment))
            ++applied;
    }
    return applied;
}

bool OptionRegistry::loadDefaults()
{
    return loadFromFile(defaultOptionsPath());
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    return locateConfigRoot();
}

std::string OptionRegistry::environmentName(const std::string &prefix, const std::string &key)
{
    std::string name = prefix;
    if (!name.empty() && name.back() != '_')
        name += '_';
    for (std::size_t i = 0; i < key.size(); ++i)
    {
        auto ch = static_cast<unsigned char>(key[i]);
        if (i > 0 && std::isupper(ch))
            name += '_';
        name += static_cast<char>(std::toupper(ch));
    }
    return name;
}

std::optional<OptionValue> OptionRegistry::coerce(const OptionDefinition &definition, const OptionValue &value) const
{
    std::optional<OptionValue> result;
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (value.isBool())
            result = value;
        else if (value.isString())
        {
            if (std::optional<bool> flag = parseSwitch(value.toString()))
                result = OptionValue(*flag);
        }
        break;
    case OptionKind::String:
        if (!value.isNull())
            result = OptionValue(value.toString());
        break;
    case OptionKind::Characters:
        if (value.isString())
            result = OptionValue(characterSet(value.toString()));
        break;
    }

    if (result && !definition.allowedValues.empty())
    {
        const std::string text = result->toString();
        if (std::find(definition.allowedValues.begin(), definition.allowedValues.end(), text) ==
            definition.allowedValues.end())
            return std::nullopt;
    }
    return result;
}

} // namespace mm::config
