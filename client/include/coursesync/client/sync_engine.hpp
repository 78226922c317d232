#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "coursesync/client/courtesy_gate.hpp"
#include "coursesync/client/logger.hpp"
#include "coursesync/client/sync_ledger.hpp"
#include "coursesync/client/transport.hpp"
#include "coursesync/error_codes.hpp"
#include "coursesync/model.hpp"

namespace coursesync::client
{

    enum class SyncStatus : std::uint8_t
    {
        Downloaded,
        Skipped,
        Failed
    };

    std::string_view to_string(SyncStatus status) noexcept;

    struct SyncOutcome
    {
        SyncStatus status{SyncStatus::Skipped};
        ErrorCode error{ErrorCode::Ok};
        std::string reason{};
        std::uint64_t bytes{};
    };

    // One mutex per destination path, so the existence check and the write that
    // follows it happen as one step even when several workers share a tree.
    class PathLocks
    {
    public:
        std::unique_lock<std::mutex> lock(const std::filesystem::path &path);

    private:
        std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    };

    struct SyncEngineOptions
    {
        std::filesystem::path root;
        std::chrono::milliseconds courtesy_delay{500};
    };

    class SyncEngine
    {
    public:
        SyncEngine(Transport &transport, SyncEngineOptions options, CourtesyGate &gate, PathLocks &locks,
                   Logger &logger, SyncLedger *ledger = nullptr);

        /**
         * Skipped when a regular file already exists at the destination (no request
         * is made). Otherwise streams into "<dest>.part" and renames it into place.
         * Never throws for transport or filesystem problems; those become Failed.
         */
        SyncOutcome sync(const model::LeafFile &file);

        std::filesystem::path destination(const model::LeafFile &file) const;

    private:
        std::uint64_t download(const model::LeafFile &file, const std::filesystem::path &target);
        void record(const model::LeafFile &file, const std::filesystem::path &target, std::uint64_t bytes);

        Transport &transport_;
        SyncEngineOptions options_;
        CourtesyGate &gate_;
        PathLocks &locks_;
        Logger &logger_;
        SyncLedger *ledger_;
    };

} // namespace coursesync::client
