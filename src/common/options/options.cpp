#include "sc/options.hpp"

#include "sc/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

namespace sc::config
{
namespace
{

std::optional<bool> parseBool(const std::string &text)
{
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(const std::string &text)
{
    try
    {
        std::size_t consumed = 0;
        long long parsed = std::stoll(text, &consumed, 0);
        if (consumed == text.size())
            return static_cast<std::int64_t>(parsed);
    }
    catch (const std::invalid_argument &)
    {
    }
    catch (const std::out_of_range &)
    {
    }
    return std::nullopt;
}

nlohmann::json toJson(const OptionValue &value)
{
    auto kind = value.kind();
    if (!kind)
        return nullptr;
    switch (*kind)
    {
    case OptionKind::Boolean:
        return value.toBool();
    case OptionKind::Integer:
        return value.toInteger();
    case OptionKind::String:
        return value.toString();
    case OptionKind::StringList:
        return value.toStringList();
    }
    return nullptr;
}

OptionValue fromJson(const nlohmann::json &json)
{
    if (json.is_boolean())
        return OptionValue(json.get<bool>());
    if (json.is_number_integer())
        return OptionValue(json.get<std::int64_t>());
    if (json.is_number_float())
        return OptionValue(static_cast<std::int64_t>(json.get<double>()));
    if (json.is_string())
        return OptionValue(json.get<std::string>());
    if (json.is_array())
    {
        std::vector<std::string> items;
        for (const auto &item : json)
        {
            if (item.is_string())
                items.push_back(item.get<std::string>());
        }
        return OptionValue(std::move(items));
    }
    return OptionValue();
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "sc-utilities";
    if (const char *home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "sc-utilities";
    return std::filesystem::path(".config") / "sc-utilities";
}

} // namespace

OptionValue::OptionValue(bool value)
    : storage(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : storage(value)
{
}

OptionValue::OptionValue(std::string value)
    : storage(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : storage(std::string(value ? value : ""))
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : storage(std::move(value))
{
}

std::optional<OptionKind> OptionValue::kind() const noexcept
{
    if (std::holds_alternative<bool>(storage))
        return OptionKind::Boolean;
    if (std::holds_alternative<std::int64_t>(storage))
        return OptionKind::Integer;
    if (std::holds_alternative<std::string>(storage))
        return OptionKind::String;
    if (std::holds_alternative<std::vector<std::string>>(storage))
        return OptionKind::StringList;
    return std::nullopt;
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *flag = std::get_if<bool>(&storage))
        return *flag;
    if (auto *number = std::get_if<std::int64_t>(&storage))
        return *number != 0;
    if (auto *text = std::get_if<std::string>(&storage))
        return parseBool(*text).value_or(fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *number = std::get_if<std::int64_t>(&storage))
        return *number;
    if (auto *flag = std::get_if<bool>(&storage))
        return *flag ? 1 : 0;
    if (auto *text = std::get_if<std::string>(&storage))
        return parseInteger(*text).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *text = std::get_if<std::string>(&storage))
        return *text;
    if (auto *flag = std::get_if<bool>(&storage))
        return *flag ? "true" : "false";
    if (auto *number = std::get_if<std::int64_t>(&storage))
        return std::to_string(*number);
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (auto *list = std::get_if<std::vector<std::string>>(&storage))
        return *list;
    if (auto *text = std::get_if<std::string>(&storage))
        return {*text};
    return {};
}

OptionValue OptionValue::convertedTo(OptionKind target, const OptionValue &fallback) const
{
    switch (target)
    {
    case OptionKind::Boolean:
        return OptionValue(toBool(fallback.toBool()));
    case OptionKind::Integer:
        return OptionValue(toInteger(fallback.toInteger()));
    case OptionKind::String:
        return OptionValue(toString(fallback.toString()));
    case OptionKind::StringList:
        if (isNull())
            return OptionValue(fallback.toStringList());
        return OptionValue(toStringList());
    }
    return fallback;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = it->second.convertedTo(definition.kind, definition.defaultValue);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    return findDefinition(key);
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
        result.push_back(definition);
    std::sort(result.begin(), result.end(),
              [](const OptionDefinition &a, const OptionDefinition &b) { return a.displayName < b.displayName; });
    return result;
}

bool OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
        return false;
    overrides[key] = value.convertedTo(definition->kind, definition->defaultValue);
    return true;
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

bool OptionRegistry::isOverridden(const std::string &key) const noexcept
{
    return overrides.find(key) != overrides.end();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    if (auto it = overrides.find(key); it != overrides.end())
        return it->second;
    if (const OptionDefinition *definition = findDefinition(key))
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

std::vector<std::string> OptionRegistry::getStringList(const std::string &key) const
{
    return get(key).toStringList();
}

bool OptionRegistry::loadFromStream(std::istream &in)
{
    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        sc::log::warn(id + ": ignoring unreadable options (" + e.what() + ")");
        return false;
    }

    if (!data.is_object())
    {
        sc::log::warn(id + ": options document is not a JSON object");
        return false;
    }

    for (const auto &[key, json] : data.items())
    {
        const OptionDefinition *definition = findDefinition(key);
        if (!definition)
            continue;
        if (json.is_null())
        {
            overrides.erase(key);
            continue;
        }
        overrides[key] = fromJson(json).convertedTo(definition->kind, definition->defaultValue);
    }
    return true;
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;
    return loadFromStream(in);
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, definition] : definitions)
        data[key] = toJson(get(key));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath, std::ios::trunc);
    if (!out)
    {
        sc::log::error(id + ": cannot write options to '" + filePath.string() + "'");
        return false;
    }
    out << data.dump(2) << '\n';
    return static_cast<bool>(out);
}

std::filesystem::path OptionRegistry::storePath() const
{
    if (!storeOverride.empty())
        return storeOverride;
    return configRoot() / id / "defaults.json";
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = storePath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(storePath());
}

std::filesystem::path OptionRegistry::configRoot()
{
    static const std::filesystem::path root = detectConfigRoot();
    return root;
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

} // namespace sc::config
