#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coursesync::client
{

    // Record of completed downloads kept under <root>/.coursesync/ledger.json.
    // It is informational only: skip decisions look at the filesystem, never here.
    class SyncLedger
    {
    public:
        struct Entry
        {
            std::string path; // generic form, relative to the ledger root
            std::string source;
            std::uint64_t size{};
            std::string hash;
            std::int64_t downloaded_at{};
        };

        enum class VerifyStatus : std::uint8_t
        {
            Ok,
            Missing,
            Modified
        };

        struct VerifyResult
        {
            Entry entry;
            VerifyStatus status{VerifyStatus::Ok};
        };

        explicit SyncLedger(std::filesystem::path root);

        static std::filesystem::path ledger_path(const std::filesystem::path &root);

        void record(const std::filesystem::path &file, const std::string &source, std::uint64_t size,
                    const std::string &hash);

        std::vector<Entry> entries() const;

        std::optional<Entry> find(const std::filesystem::path &file) const;

        std::vector<VerifyResult> verify() const;

        const std::optional<std::string> &load_error() const noexcept { return load_error_; }

    private:
        void load();
        void save() const;
        std::string relative_key(const std::filesystem::path &file) const;

        std::filesystem::path root_;
        std::filesystem::path ledger_path_;
        mutable std::mutex mutex_;
        std::vector<Entry> entries_;
        std::optional<std::string> load_error_;
    };

    std::string_view to_string(SyncLedger::VerifyStatus status) noexcept;

} // namespace coursesync::client
