#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mm::config
{

enum class OptionKind
{
    Boolean,
    String,
    // Set of printable ASCII characters, stored as a string without repeats.
    Characters
};

// Where the effective value of an option came from, lowest precedence first.
enum class OptionSource
{
    Default,
    File,
    Environment,
    CommandLine
};

std::string_view sourceName(OptionSource source) noexcept;

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::string value);
    OptionValue(const char *value);

    bool isNull() const noexcept;
    bool isBool() const noexcept;
    bool isString() const noexcept;

    bool toBool(bool fallback = false) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const noexcept { return value == other.value; }
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::string> value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
    // Empty means any value is accepted.
    std::vector<std::string> allowedValues;
};

struct ResolvedOption
{
    const OptionDefinition *definition = nullptr;
    OptionValue value;
    OptionSource source = OptionSource::Default;
};

class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(OptionDefinition definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const noexcept;

    // Returns false, leaving the option untouched, for unknown keys and for
    // values the definition cannot accept.
    bool set(const std::string &key, const OptionValue &value, OptionSource source = OptionSource::CommandLine);
    void reset(const std::string &key);
    void resetToDefaults() noexcept;

    OptionValue get(const std::string &key) const;
    OptionSource sourceOf(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    // Every registered option with its effective value, ordered by key.
    std::vector<ResolvedOption> resolvedOptions() const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    // Reads PREFIX_KEY for every option, the key spelled in upper snake case
    // (MM_FIX_EXTRA_NODE_TRIGGERS for extraNodeTriggers). Returns how many
    // variables were applied.
    std::size_t loadFromEnvironment(const std::string &prefix);

    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();
    static std::string environmentName(const std::string &prefix, const std::string &key);

private:
    struct StoredValue
    {
        OptionValue value;
        OptionSource source = OptionSource::Default;
    };

    std::optional<OptionValue> coerce(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, StoredValue> stored;
};

} // namespace mm::config
