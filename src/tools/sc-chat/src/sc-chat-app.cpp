#include "ui/chat_app.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    bool is_help_flag(std::string_view arg)
    {
        return arg == "--help" || arg == "-h";
    }

    struct CliOptions
    {
        bool showHelp = false;
        std::optional<std::string> error;
        ChatApp::StartupOptions startup;
    };

    // Accepts both "--name value" and "--name=value".
    std::optional<std::string> option_value(std::string_view name, int argc, char **argv, int &i)
    {
        std::string_view arg(argv[i]);
        if (arg == name)
        {
            if (i + 1 >= argc)
                return std::nullopt;
            return std::string(argv[++i]);
        }
        if (arg.size() > name.size() && arg.substr(0, name.size()) == name && arg[name.size()] == '=')
            return std::string(arg.substr(name.size() + 1));
        return std::nullopt;
    }

    bool matches(std::string_view arg, std::string_view name)
    {
        return arg == name || (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
                               arg[name.size()] == '=');
    }

    CliOptions parse_cli(int argc, char **argv)
    {
        CliOptions options;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (is_help_flag(arg))
            {
                options.showHelp = true;
                continue;
            }

            std::string_view name;
            if (matches(arg, "--config"))
                name = "--config";
            else if (matches(arg, "--replay"))
                name = "--replay";
            else if (matches(arg, "--channel"))
                name = "--channel";
            else
            {
                options.error = "unknown argument '" + std::string(arg) + "'";
                return options;
            }

            std::optional<std::string> value = option_value(name, argc, argv, i);
            if (!value || value->empty())
            {
                options.error = std::string(name) + " needs a value";
                return options;
            }
            if (name == "--config")
                options.startup.configPath = *value;
            else if (name == "--replay")
                options.startup.replayPath = *value;
            else
                options.startup.channels.push_back(*value);
        }
        return options;
    }

    void print_usage(std::ostream &out)
    {
        out << "Usage: sc-chat [--config PATH] [--replay FILE] [--channel NAME]...\n";
        out << "  --config PATH   read and save options in PATH instead of the default store\n";
        out << "  --replay FILE   play chat lines from a JSON-lines file\n";
        out << "  --channel NAME  open a window for NAME at startup (repeatable)\n";
        out << "Set SC_CHAT_LOG to choose the log file." << std::endl;
    }

} // namespace

int main(int argc, char **argv)
{
    CliOptions options = parse_cli(argc, argv);
    if (options.error)
    {
        std::cerr << "sc-chat: " << *options.error << "\n";
        print_usage(std::cerr);
        return 2;
    }
    if (options.showHelp)
    {
        print_usage(std::cout);
        return 0;
    }

    ChatApp app(argc, argv, options.startup);
    app.run();
    app.shutDown();
    return 0;
}
