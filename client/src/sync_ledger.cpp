#include "coursesync/client/sync_ledger.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "coursesync/crypto.hpp"

namespace coursesync::client
{

    SyncLedger::SyncLedger(std::filesystem::path root)
        : root_(std::move(root)), ledger_path_(ledger_path(root_))
    {
        load();
    }

    std::filesystem::path SyncLedger::ledger_path(const std::filesystem::path &root)
    {
        return root / ".coursesync" / "ledger.json";
    }

    void SyncLedger::record(const std::filesystem::path &file, const std::string &source, std::uint64_t size,
                            const std::string &hash)
    {
        Entry entry{
            .path = relative_key(file),
            .source = source,
            .size = size,
            .hash = hash,
            .downloaded_at = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count(),
        };

        std::lock_guard lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &existing)
                               { return existing.path == entry.path; });
        if (it != entries_.end())
        {
            *it = std::move(entry);
        }
        else
        {
            entries_.push_back(std::move(entry));
        }
        save();
    }

    std::vector<SyncLedger::Entry> SyncLedger::entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::optional<SyncLedger::Entry> SyncLedger::find(const std::filesystem::path &file) const
    {
        const auto key = relative_key(file);
        std::lock_guard lock(mutex_);
        for (const auto &entry : entries_)
        {
            if (entry.path == key)
            {
                return entry;
            }
        }
        return std::nullopt;
    }

    std::vector<SyncLedger::VerifyResult> SyncLedger::verify() const
    {
        std::vector<VerifyResult> results;
        for (auto &entry : entries())
        {
            const auto path = root_ / std::filesystem::path(entry.path);
            VerifyResult result{.entry = std::move(entry), .status = VerifyStatus::Ok};
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                result.status = VerifyStatus::Missing;
            }
            else if (std::filesystem::file_size(path, ec) != result.entry.size || ec ||
                     crypto::hash_file(path) != result.entry.hash)
            {
                result.status = VerifyStatus::Modified;
            }
            results.push_back(std::move(result));
        }
        return results;
    }

    void SyncLedger::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(ledger_path_))
        {
            return;
        }
        std::ifstream in(ledger_path_);
        if (!in.is_open())
        {
            load_error_ = "cannot open " + ledger_path_.string();
            return;
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            load_error_ = ledger_path_.string() + " is corrupt and will be rewritten: " + ex.what();
            return;
        }
        if (!json.is_array())
        {
            load_error_ = ledger_path_.string() + " is not a JSON array and will be rewritten";
            return;
        }
        try
        {
            for (const auto &item : json)
            {
                if (!item.is_object())
                {
                    continue;
                }
                Entry entry;
                entry.path = item.value("path", std::string{});
                entry.source = item.value("source", std::string{});
                entry.size = item.value("size", 0ULL);
                entry.hash = item.value("hash", std::string{});
                entry.downloaded_at = item.value("downloaded_at", 0LL);
                if (!entry.path.empty())
                {
                    entries_.push_back(std::move(entry));
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            entries_.clear();
            load_error_ = ledger_path_.string() + " has a malformed entry and will be rewritten: " + ex.what();
        }
    }

    void SyncLedger::save() const
    {
        const auto dir = ledger_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"path", entry.path},
                            {"source", entry.source},
                            {"size", entry.size},
                            {"hash", entry.hash},
                            {"downloaded_at", entry.downloaded_at}});
        }

        auto temp = ledger_path_;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to write ledger: " + temp.string());
            }
            out << json.dump(2);
        }
        std::error_code ec;
        std::filesystem::rename(temp, ledger_path_, ec);
        if (ec)
        {
            throw std::runtime_error("Failed to replace ledger: " + ec.message());
        }
    }

    std::string SyncLedger::relative_key(const std::filesystem::path &file) const
    {
        const auto relative = file.lexically_normal().lexically_relative(root_.lexically_normal());
        if (relative.empty() || *relative.begin() == "..")
        {
            return file.lexically_normal().generic_string();
        }
        return relative.generic_string();
    }

    std::string_view to_string(SyncLedger::VerifyStatus status) noexcept
    {
        switch (status)
        {
        case SyncLedger::VerifyStatus::Ok:
            return "ok";
        case SyncLedger::VerifyStatus::Missing:
            return "missing";
        case SyncLedger::VerifyStatus::Modified:
            return "modified";
        }
        return "unknown";
    }

} // namespace coursesync::client
