#include "coursesync/client/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "coursesync/errors.hpp"

namespace coursesync::client
{

    namespace
    {

        std::string trim(const std::string &value)
        {
            const auto first = value.find_first_not_of(" \t\r");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r");
            return value.substr(first, last - first + 1);
        }

        std::string unquote(std::string value)
        {
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            {
                return value.substr(1, value.size() - 2);
            }
            return value;
        }

        std::string normalize_base_url(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            constexpr std::string_view kApiSuffix = "/api/v1";
            if (url.size() >= kApiSuffix.size() &&
                url.compare(url.size() - kApiSuffix.size(), kApiSuffix.size(), kApiSuffix) == 0)
            {
                url.erase(url.size() - kApiSuffix.size());
            }
            return url;
        }

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::size_t parse_count(const std::string &value, const std::string &flag, std::size_t min, std::size_t max)
        {
            if (value.empty() || value.front() == '-' || value.front() == '+')
            {
                throw std::runtime_error(flag + " expects a number between " + std::to_string(min) + " and " +
                                         std::to_string(max));
            }
            std::size_t consumed = 0;
            const auto parsed = std::stoull(value, &consumed);
            if (consumed != value.size() || parsed < min || parsed > max)
            {
                throw std::runtime_error(flag + " expects a number between " + std::to_string(min) + " and " +
                                         std::to_string(max));
            }
            return static_cast<std::size_t>(parsed);
        }

        std::optional<std::string> env_value(const char *name)
        {
            if (const char *value = std::getenv(name); value != nullptr && *value != '\0')
            {
                return std::string(value);
            }
            return std::nullopt;
        }

    } // namespace

    std::string SyncConfig::api_root() const
    {
        return base_url + "/api/v1";
    }

    std::string usage_text()
    {
        return "Usage: coursesync [modules|submissions|verify] [--all | --courses \"1 3\" | --current-term | "
               "--terms \"1,2\"]\n"
               "                  [--root <dir>] [--jobs <n>] [--delay-ms <ms>] [--retries <n>]\n"
               "                  [--base-url <url>] [--env <file>] [--log <file>] [--verbose]\n";
    }

    SyncConfig parse_arguments(int argc, char *argv[])
    {
        SyncConfig config;
        int index = 1;

        if (index < argc && argv[index][0] != '-')
        {
            const std::string command = argv[index++];
            if (command == "modules")
            {
                config.kind = SyncKind::Modules;
            }
            else if (command == "submissions")
            {
                config.kind = SyncKind::Submissions;
            }
            else if (command == "verify")
            {
                config.kind = SyncKind::Verify;
            }
            else
            {
                throw std::runtime_error("Unknown command: " + command);
            }
        }

        auto set_selection = [&config](SelectionMode mode)
        {
            if (config.selection)
            {
                throw std::runtime_error("Only one of --all, --courses, --current-term, --terms may be given");
            }
            config.selection = mode;
        };

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--all")
            {
                set_selection(SelectionMode::All);
            }
            else if (arg == "--courses")
            {
                set_selection(SelectionMode::ByIndex);
                config.selection_tokens = require_value(index, argc, argv, arg);
            }
            else if (arg == "--current-term")
            {
                set_selection(SelectionMode::CurrentTerm);
            }
            else if (arg == "--terms")
            {
                set_selection(SelectionMode::ByTerm);
                config.selection_tokens = require_value(index, argc, argv, arg);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--jobs")
            {
                config.jobs = parse_count(require_value(index, argc, argv, arg), arg, 1, kMaxJobs);
            }
            else if (arg == "--delay-ms")
            {
                config.courtesy_delay = std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg)));
                if (config.courtesy_delay->count() < 0)
                {
                    throw std::runtime_error("--delay-ms must not be negative");
                }
            }
            else if (arg == "--retries")
            {
                config.retries = parse_count(require_value(index, argc, argv, arg), arg, 0, kMaxRetries);
            }
            else if (arg == "--base-url")
            {
                config.base_url = normalize_base_url(require_value(index, argc, argv, arg));
            }
            else if (arg == "--env")
            {
                config.env_file = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

    std::map<std::string, std::string> parse_env_file(const std::filesystem::path &path)
    {
        std::map<std::string, std::string> values;
        std::ifstream in(path);
        if (!in.is_open())
        {
            return values;
        }
        std::string line;
        while (std::getline(in, line))
        {
            line = trim(line);
            if (line.empty() || line.front() == '#')
            {
                continue;
            }
            if (line.rfind("export ", 0) == 0)
            {
                line = trim(line.substr(7));
            }
            const auto eq = line.find('=');
            if (eq == std::string::npos)
            {
                continue;
            }
            auto key = trim(line.substr(0, eq));
            if (key.empty())
            {
                continue;
            }
            values[key] = unquote(trim(line.substr(eq + 1)));
        }
        return values;
    }

    void load_credentials(SyncConfig &config)
    {
        const auto env_path = config.env_file.value_or(std::filesystem::path(".env"));
        if (config.env_file && !std::filesystem::exists(env_path))
        {
            throw AuthConfigError("Environment file not found: " + env_path.string());
        }
        const auto file_values = parse_env_file(env_path);

        auto lookup = [&file_values](const char *name) -> std::optional<std::string>
        {
            if (auto value = env_value(name))
            {
                return value;
            }
            const auto it = file_values.find(name);
            if (it != file_values.end() && !it->second.empty())
            {
                return it->second;
            }
            return std::nullopt;
        };

        if (config.base_url.empty())
        {
            if (auto url = lookup("CANVAS_URL"))
            {
                config.base_url = normalize_base_url(*url);
            }
        }
        if (config.token.empty())
        {
            if (auto token = lookup("CANVAS_TOKEN"))
            {
                config.token = *token;
            }
            else if (auto legacy = lookup("CANVAS_API_TOKEN"))
            {
                config.token = *legacy;
            }
        }

        if (config.base_url.empty())
        {
            throw AuthConfigError("Set CANVAS_URL in the environment or .env (or pass --base-url)");
        }
        if (config.token.empty())
        {
            throw AuthConfigError("Set CANVAS_TOKEN in the environment or .env");
        }
    }

} // namespace coursesync::client
