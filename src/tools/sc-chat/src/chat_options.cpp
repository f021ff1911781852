#include "chat_options.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sc::chat
{

void registerChatOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionNaturalScrolling, config::OptionKind::Boolean, config::OptionValue(false),
                             "Natural Scrolling", "Reverse the direction of wheel and page scrolling."});
    registry.registerOption({kOptionScrollbackLimit, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(kDefaultScrollbackLimit)),
                             "Scrollback Limit", "Number of chat lines kept per channel."});
    registry.registerOption({kOptionAnimationRate, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(kDefaultAnimationRate)),
                             "Animation Rate", "Speed of smooth scrolling, in animations per second."});
    registry.registerOption({kOptionChannels, config::OptionKind::StringList,
                             config::OptionValue(std::vector<std::string>{}), "Channels",
                             "Channels opened at startup."});
    registry.registerOption({kOptionUserName, config::OptionKind::String, config::OptionValue(kDefaultUserName),
                             "User Name", "Name shown on messages you send."});
}

std::size_t scrollbackLimit(const config::OptionRegistry &registry)
{
    std::int64_t value =
        registry.getInteger(kOptionScrollbackLimit, static_cast<std::int64_t>(kDefaultScrollbackLimit));
    if (value < 1)
        return kDefaultScrollbackLimit;
    return static_cast<std::size_t>(value);
}

float animationRate(const config::OptionRegistry &registry)
{
    std::int64_t value = registry.getInteger(kOptionAnimationRate, kDefaultAnimationRate);
    if (value < 1 || value > 1000)
        return static_cast<float>(kDefaultAnimationRate);
    return static_cast<float>(value);
}

std::string userName(const config::OptionRegistry &registry)
{
    std::string name = registry.getString(kOptionUserName, kDefaultUserName);
    if (name.find_first_not_of(" \t") == std::string::npos)
        return kDefaultUserName;
    return name;
}

} // namespace sc::chat
