#include "coursesync/client/session.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <iomanip>
#include <iostream>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

#include "coursesync/client/catalog.hpp"
#include "coursesync/errors.hpp"

namespace coursesync::client
{

    namespace
    {

        constexpr std::chrono::milliseconds kRetryBackoff{1000};

        void merge(RunSummary &into, const RunSummary &from)
        {
            into.containers_synced += from.containers_synced;
            into.containers_denied += from.containers_denied;
            into.containers_failed += from.containers_failed;
            into.downloaded += from.downloaded;
            into.skipped += from.skipped;
            into.failed += from.failed;
            into.unresolved_items += from.unresolved_items;
            into.bytes += from.bytes;
        }

    } // namespace

    SyncSession::SyncSession(SyncConfig config, Logger &logger, Transport &transport, Prompt &prompt,
                             CourtesyGate::Sleeper sleeper)
        : config_(std::move(config)),
          logger_(logger),
          prompt_(prompt),
          gate_(sleeper)
    {
        Transport *inner = &transport;
        if (config_.retries > 0)
        {
            retrying_ = std::make_unique<RetryingTransport>(transport, config_.retries, kRetryBackoff, logger_,
                                                            std::move(sleeper));
            inner = retrying_.get();
        }
        paced_ = std::make_unique<PacedTransport>(*inner, gate_);
        ledger_ = std::make_unique<SyncLedger>(config_.root);
        if (ledger_->load_error())
        {
            logger_.warn("ledger", "Ignoring unreadable ledger: ", *ledger_->load_error());
        }
    }

    int SyncSession::run()
    {
        if (config_.kind == SyncKind::Verify)
        {
            return verify();
        }

        try
        {
            Paginator paginator(*paced_, config_.per_page);
            CourseCatalog catalog(paginator, config_.api_root(), logger_);
            const auto discovery = catalog.discover();
            if (discovery.courses.empty())
            {
                throw SyncError(ErrorCode::NoContainers, "No courses found for this account");
            }

            const auto chosen = choose_courses(discovery.courses);
            const auto summary = sync_courses(chosen);
            print_summary(summary);
            if (summary.containers_selected > 0 && summary.containers_synced == 0)
            {
                logger_.error("session", "No selected course could be processed");
                return 1;
            }
            return 0;
        }
        catch (const Error &ex)
        {
            std::cerr << "ERROR: " << to_string(ex.code()) << std::endl;
            std::cerr << ex.what() << std::endl;
            logger_.error("session", "fatal: ", ex.what());
            return 1;
        }
    }

    std::vector<model::Course> SyncSession::choose_courses(const std::vector<model::Course> &courses)
    {
        SelectionMode mode = SelectionMode::All;
        std::optional<std::string> tokens;
        if (config_.selection)
        {
            mode = *config_.selection;
            if (mode == SelectionMode::ByIndex || mode == SelectionMode::ByTerm)
            {
                tokens = config_.selection_tokens;
            }
        }
        else
        {
            mode = prompt_.ask_mode(courses.size());
            if (mode == SelectionMode::ByIndex)
            {
                tokens = prompt_.ask_courses(courses);
            }
            else if (mode == SelectionMode::ByTerm)
            {
                tokens = ask_terms(courses);
            }
        }

        auto chosen = select(courses, mode, tokens);
        if (mode == SelectionMode::CurrentTerm && chosen.empty())
        {
            logger_.warn("select", "Could not detect the current term; choose terms instead");
            chosen = select(courses, SelectionMode::ByTerm, ask_terms(courses));
        }
        else if (mode == SelectionMode::CurrentTerm)
        {
            logger_.info("select", "Detected current term: ", chosen.front().term_name());
        }
        if (chosen.empty())
        {
            throw SelectionError(ErrorCode::EmptySelection, "No courses selected");
        }
        logger_.info("select", "Selected ", chosen.size(), " course(s) (", to_string(mode), ")");
        return chosen;
    }

    std::string SyncSession::ask_terms(const std::vector<model::Course> &courses)
    {
        const auto terms = collect_terms(courses);
        if (terms.empty())
        {
            throw SelectionError(ErrorCode::EmptySelection, "No terms available to choose from");
        }
        return prompt_.ask_terms(terms);
    }

    std::unique_ptr<GroupSource> SyncSession::make_source(Paginator &paginator) const
    {
        if (config_.kind == SyncKind::Submissions)
        {
            return std::make_unique<SubmissionSource>(paginator, config_.api_root());
        }
        return std::make_unique<ModuleSource>(paginator, config_.api_root());
    }

    std::filesystem::path SyncSession::source_root(const GroupSource &source) const
    {
        const auto prefix = source.root_prefix();
        return prefix.empty() ? config_.root : config_.root / prefix;
    }

    RunSummary SyncSession::sync_courses(const std::vector<model::Course> &courses)
    {
        Paginator paginator(*paced_, config_.per_page);
        const auto source = make_source(paginator);
        ResourceResolver resolver(*paced_, config_.api_root(), *source, logger_);
        SyncEngine engine(*paced_,
                          SyncEngineOptions{.root = source_root(*source),
                                            .courtesy_delay = config_.courtesy_delay.value_or(source->courtesy_delay())},
                          gate_, locks_, logger_, ledger_.get());

        RunSummary summary;
        summary.containers_selected = courses.size();
        logger_.info("session", "Syncing ", source->name(), " for ", courses.size(), " course(s) into ",
                     source_root(*source).string());

        if (config_.jobs <= 1 || courses.size() <= 1)
        {
            for (const auto &course : courses)
            {
                process_course(course, resolver, engine, summary);
            }
        }
        else
        {
            asio::thread_pool pool(config_.jobs);
            for (const auto &course : courses)
            {
                asio::post(pool, [this, &course, &resolver, &engine, &summary]()
                           { process_course(course, resolver, engine, summary); });
            }
            pool.join();
        }
        logger_.flush();
        return summary;
    }

    void SyncSession::process_course(const model::Course &course, ResourceResolver &resolver, SyncEngine &engine,
                                     RunSummary &summary)
    {
        RunSummary local;
        logger_.info("session", "Course: ", course.name, " [", course.term_name(), "]");
        try
        {
            const auto resolved = resolver.resolve(course);
            if (resolved.access_denied)
            {
                local.containers_denied = 1;
            }
            else
            {
                local.containers_synced = 1;
                local.unresolved_items = resolved.unresolved_items;
                for (const auto &group : resolved.groups)
                {
                    for (const auto &file : group.files)
                    {
                        const auto outcome = engine.sync(file);
                        switch (outcome.status)
                        {
                        case SyncStatus::Downloaded:
                            ++local.downloaded;
                            local.bytes += outcome.bytes;
                            break;
                        case SyncStatus::Skipped:
                            ++local.skipped;
                            break;
                        case SyncStatus::Failed:
                            ++local.failed;
                            break;
                        }
                    }
                }
            }
        }
        catch (const Error &ex)
        {
            logger_.error("session", "Course ", course.name, " (", course.id, ") failed: ", ex.what());
            local.containers_failed = 1;
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.error("session", "Course ", course.name, " (", course.id, ") returned malformed data: ", ex.what());
            local.containers_failed = 1;
        }

        std::lock_guard lock(summary_mutex_);
        merge(summary, local);
    }

    void SyncSession::print_summary(const RunSummary &summary) const
    {
        std::cout << "\nCourses: " << summary.containers_selected << " selected, " << summary.containers_synced
                  << " synced, " << summary.containers_denied << " denied, " << summary.containers_failed
                  << " failed" << std::endl;
        std::cout << "Files: " << summary.downloaded << " downloaded (" << summary.bytes << " bytes), "
                  << summary.skipped << " skipped, " << summary.failed << " failed, " << summary.unresolved_items
                  << " unresolved" << std::endl;
    }

    int SyncSession::verify()
    {
        if (ledger_->load_error())
        {
            std::cerr << "ERROR: " << to_string(ErrorCode::FileIo) << std::endl;
            std::cerr << *ledger_->load_error() << std::endl;
            return 1;
        }

        const auto results = ledger_->verify();
        std::size_t problems = 0;
        for (const auto &result : results)
        {
            std::cout << std::left << std::setw(10) << to_string(result.status) << result.entry.path << std::endl;
            if (result.status != SyncLedger::VerifyStatus::Ok)
            {
                ++problems;
            }
        }
        std::cout << "Verified " << results.size() << " file(s), " << problems << " problem(s)" << std::endl;
        return problems == 0 ? 0 : 1;
    }

} // namespace coursesync::client
