#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sc::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
    StringList
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);
    OptionValue(const char *value);
    OptionValue(std::vector<std::string> value);

    // Kind of the stored value, or nothing for an empty value.
    std::optional<OptionKind> kind() const noexcept;
    bool isNull() const noexcept { return std::holds_alternative<std::monostate>(storage); }

    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;
    std::vector<std::string> toStringList() const;

    // Converts to `kind`, using `fallback` where no sensible conversion exists.
    OptionValue convertedTo(OptionKind kind, const OptionValue &fallback) const;

    bool operator==(const OptionValue &other) const noexcept { return storage == other.storage; }
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, std::string, std::vector<std::string>> storage;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
};

// Typed settings of one application, persisted as a flat JSON object.
// Values read back from disk are normalised to the kind of their definition;
// keys without a definition are ignored.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const;
    std::vector<OptionDefinition> listRegisteredOptions() const;

    // Returns false for unregistered keys.
    bool set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);
    bool isOverridden(const std::string &key) const noexcept;

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    bool loadFromStream(std::istream &in);
    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    // The store used by loadDefaults()/saveDefaults(). Defaults to
    // configRoot()/<appId>/defaults.json.
    void setStorePath(std::filesystem::path path) { storeOverride = std::move(path); }
    std::filesystem::path storePath() const;

    bool loadDefaults();
    bool saveDefaults() const;

    static std::filesystem::path configRoot();

private:
    const OptionDefinition *findDefinition(const std::string &key) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
    std::filesystem::path storeOverride;
};

} // namespace sc::config
