#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "coursesync/client/config.hpp"
#include "coursesync/client/courtesy_gate.hpp"
#include "coursesync/client/logger.hpp"
#include "coursesync/client/paginator.hpp"
#include "coursesync/client/prompt.hpp"
#include "coursesync/client/resolver.hpp"
#include "coursesync/client/sync_engine.hpp"
#include "coursesync/client/sync_ledger.hpp"
#include "coursesync/client/transport.hpp"
#include "coursesync/model.hpp"

namespace coursesync::client
{

    struct RunSummary
    {
        std::size_t containers_selected{};
        std::size_t containers_synced{};
        std::size_t containers_denied{};
        std::size_t containers_failed{};
        std::size_t downloaded{};
        std::size_t skipped{};
        std::size_t failed{};
        std::size_t unresolved_items{};
        std::uint64_t bytes{};
    };

    // One run: discover courses, choose a subset, then resolve and sync each of them.
    class SyncSession
    {
    public:
        SyncSession(SyncConfig config, Logger &logger, Transport &transport, Prompt &prompt,
                    CourtesyGate::Sleeper sleeper = CourtesyGate::default_sleeper());

        // Process exit status: 0 on success, 1 on startup/input errors or when no
        // selected course could be processed.
        int run();

        std::vector<model::Course> choose_courses(const std::vector<model::Course> &courses);

        RunSummary sync_courses(const std::vector<model::Course> &courses);

        // Re-hashes every ledger entry under the download root.
        int verify();

    private:
        std::string ask_terms(const std::vector<model::Course> &courses);
        std::unique_ptr<GroupSource> make_source(Paginator &paginator) const;
        void process_course(const model::Course &course, ResourceResolver &resolver, SyncEngine &engine,
                            RunSummary &summary);
        void print_summary(const RunSummary &summary) const;
        std::filesystem::path source_root(const GroupSource &source) const;

        SyncConfig config_;
        Logger &logger_;
        Prompt &prompt_;
        CourtesyGate gate_;
        PathLocks locks_;
        std::unique_ptr<RetryingTransport> retrying_;
        std::unique_ptr<PacedTransport> paced_;
        std::unique_ptr<SyncLedger> ledger_;
        std::mutex summary_mutex_;
    };

} // namespace coursesync::client
