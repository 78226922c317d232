#include "coursesync/client/sync_engine.hpp"

#include <fstream>
#include <utility>

#include "coursesync/crypto.hpp"
#include "coursesync/errors.hpp"
#include "coursesync/paths.hpp"

namespace coursesync::client
{

    namespace
    {

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

    } // namespace

    std::string_view to_string(SyncStatus status) noexcept
    {
        switch (status)
        {
        case SyncStatus::Downloaded:
            return "downloaded";
        case SyncStatus::Skipped:
            return "skipped";
        case SyncStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::unique_lock<std::mutex> PathLocks::lock(const std::filesystem::path &path)
    {
        std::shared_ptr<std::mutex> entry;
        {
            std::lock_guard guard(mutex_);
            auto &slot = locks_[path.lexically_normal().generic_string()];
            if (!slot)
            {
                slot = std::make_shared<std::mutex>();
            }
            entry = slot;
        }
        // Entries are never erased, so the mutex outlives the returned lock.
        return std::unique_lock<std::mutex>(*entry);
    }

    SyncEngine::SyncEngine(Transport &transport, SyncEngineOptions options, CourtesyGate &gate, PathLocks &locks,
                           Logger &logger, SyncLedger *ledger)
        : transport_(transport),
          options_(std::move(options)),
          gate_(gate),
          locks_(locks),
          logger_(logger),
          ledger_(ledger) {}

    std::filesystem::path SyncEngine::destination(const model::LeafFile &file) const
    {
        return options_.root / file.logical_path;
    }

    SyncOutcome SyncEngine::sync(const model::LeafFile &file)
    {
        const auto target = destination(file);
        const auto label = file.logical_path.generic_string();
        auto guard = locks_.lock(target);

        std::error_code ec;
        if (std::filesystem::is_regular_file(target, ec))
        {
            logger_.info("sync", "Skipping (exists): ", label);
            return SyncOutcome{.status = SyncStatus::Skipped, .error = ErrorCode::Ok, .reason = {}, .bytes = 0};
        }

        try
        {
            const auto bytes = download(file, target);
            record(file, target, bytes);
            logger_.info("sync", "Downloaded: ", label, " (", bytes, " bytes)");
            gate_.defer(options_.courtesy_delay);
            return SyncOutcome{.status = SyncStatus::Downloaded, .error = ErrorCode::Ok, .reason = {}, .bytes = bytes};
        }
        catch (const Error &ex)
        {
            logger_.error("sync", "Failed: ", label, " -> ", ex.what());
            return SyncOutcome{.status = SyncStatus::Failed, .error = ex.code(), .reason = ex.what(), .bytes = 0};
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            logger_.error("sync", "Failed: ", label, " -> ", ex.what());
            return SyncOutcome{.status = SyncStatus::Failed, .error = ErrorCode::FileIo, .reason = ex.what(),
                               .bytes = 0};
        }
    }

    std::uint64_t SyncEngine::download(const model::LeafFile &file, const std::filesystem::path &target)
    {
        const auto parent = target.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::is_directory(parent))
            {
                throw SyncError(ErrorCode::FileIo, "cannot create " + parent.string() + ": " + ec.message());
            }
        }

        const auto part_path = paths::partial_path(target);
        std::ofstream part(part_path, std::ios::binary | std::ios::trunc);
        if (!part.is_open())
        {
            throw SyncError(ErrorCode::FileIo, "cannot open " + part_path.string() + " for writing");
        }

        std::uint64_t written = 0;
        HttpRequest request{
            .method = HttpMethod::Get,
            .url = file.source_url,
            .query = {},
            .sink = [&part, &written, &part_path](std::string_view chunk)
            {
                part.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                if (!part)
                {
                    throw SyncError(ErrorCode::FileIo, "write to " + part_path.string() + " failed");
                }
                written += chunk.size();
            },
        };

        try
        {
            transport_.request(request);
            part.close();
            if (part.fail())
            {
                throw SyncError(ErrorCode::FileIo, "closing " + part_path.string() + " failed");
            }
        }
        catch (const Error &)
        {
            part.close();
            remove_quietly(part_path);
            throw;
        }

        if (std::filesystem::exists(target))
        {
            remove_quietly(part_path);
            throw SyncError(ErrorCode::FileIo, "destination appeared during download: " + target.string());
        }

        std::error_code ec;
        std::filesystem::rename(part_path, target, ec);
        if (ec)
        {
            remove_quietly(part_path);
            throw SyncError(ErrorCode::FileIo, "failed to finalize " + target.string() + ": " + ec.message());
        }
        return written;
    }

    void SyncEngine::record(const model::LeafFile &file, const std::filesystem::path &target, std::uint64_t bytes)
    {
        if (ledger_ == nullptr)
        {
            return;
        }
        try
        {
            // Query strings on file URLs carry access verifiers; keep them out of the ledger.
            const auto source = file.source_url.substr(0, file.source_url.find('?'));
            ledger_->record(target, source, bytes, crypto::hash_file(target));
        }
        catch (const std::runtime_error &ex)
        {
            logger_.warn("ledger", "Could not record ", file.logical_path.generic_string(), ": ", ex.what());
        }
    }

} // namespace coursesync::client
