#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "coursesync/client/selector.hpp"

namespace coursesync::client
{

    enum class SyncKind : std::uint8_t
    {
        Modules,
        Submissions,
        Verify
    };

    // Upper bounds accepted for --jobs and --retries.
    inline constexpr std::size_t kMaxJobs = 32;
    inline constexpr std::size_t kMaxRetries = 10;

    struct SyncConfig
    {
        SyncKind kind{SyncKind::Modules};
        std::string base_url;
        std::string token;
        std::filesystem::path root{"downloads"};
        std::size_t per_page{100};
        std::size_t jobs{1};
        std::optional<std::chrono::milliseconds> courtesy_delay;
        std::size_t retries{0};
        std::optional<SelectionMode> selection;
        std::string selection_tokens;
        std::optional<std::filesystem::path> env_file;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        bool show_help{false};

        std::string api_root() const;
    };

    SyncConfig parse_arguments(int argc, char *argv[]);

    std::string usage_text();

    // KEY=VALUE lines; blank lines and '#' comments are ignored, surrounding quotes stripped.
    std::map<std::string, std::string> parse_env_file(const std::filesystem::path &path);

    // Fills base_url and token from the process environment, then from the env file.
    // Throws AuthConfigError when either is still missing.
    void load_credentials(SyncConfig &config);

} // namespace coursesync::client
