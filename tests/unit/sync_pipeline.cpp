#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "coursesync/client/catalog.hpp"
#include "coursesync/client/config.hpp"
#include "coursesync/client/courtesy_gate.hpp"
#include "coursesync/client/logger.hpp"
#include "coursesync/client/paginator.hpp"
#include "coursesync/client/prompt.hpp"
#include "coursesync/client/resolver.hpp"
#include "coursesync/client/session.hpp"
#include "coursesync/client/sync_engine.hpp"
#include "coursesync/client/sync_ledger.hpp"
#include "coursesync/errors.hpp"
#include "coursesync/paths.hpp"
#include "fake_transport.hpp"

using namespace coursesync;
using namespace coursesync::client;
using coursesync::testing::FakeReply;
using coursesync::testing::FakeTransport;

namespace
{

    const std::string kHost = "https://canvas.example.edu";
    const std::string kApi = kHost + "/api/v1";

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    CourtesyGate::Sleeper no_sleep()
    {
        return [](CourtesyGate::Clock::duration) {};
    }

    model::Course course(std::int64_t id, const std::string &name)
    {
        model::Course result;
        result.id = id;
        result.name = name;
        result.workflow_state = "available";
        return result;
    }

    std::string courses_url()
    {
        auto params = CourseCatalog::discovery_params();
        params.emplace_back("per_page", "100");
        params.emplace_back("page", "1");
        return build_url(kApi + "/courses", params);
    }

    std::string module_with_file(std::int64_t module_id, const std::string &name, std::int64_t file_id)
    {
        const nlohmann::json item{{"type", "File"}, {"title", name}, {"content_id", file_id}};
        const nlohmann::json module{{"id", module_id}, {"name", name}, {"items", nlohmann::json::array({item})}};
        return nlohmann::json::array({module}).dump();
    }

    void script_file(FakeTransport &fake, std::int64_t file_id, const std::string &display_name,
                     const std::string &content)
    {
        const auto download = kHost + "/files/" + std::to_string(file_id) + "/download";
        fake.on_path(kApi + "/files/" + std::to_string(file_id),
                     FakeReply{.status = 200,
                               .body = nlohmann::json{{"display_name", display_name}, {"url", download + "?verifier=abc"}}.dump()});
        fake.on_path(download, FakeReply{.status = 200, .body = content});
    }

    // CS101 is readable; course 2 answers 403 on its module listing.
    void script_two_courses(FakeTransport &fake)
    {
        fake.on(courses_url(), FakeReply{.status = 200, .body = R"([
            {"id": 1, "name": "CS101", "workflow_state": "available", "term": {"name": "Fall 2024"}},
            {"id": 2, "name": "Locked", "workflow_state": "available", "term": {"name": "Fall 2024"}}
        ])"});
        fake.on_path(kApi + "/courses/1/modules", FakeReply{.status = 200, .body = module_with_file(11, "Week 1", 10)});
        fake.on_path(kApi + "/courses/2/modules", FakeReply{.status = 403});
        script_file(fake, 10, "notes.pdf", "%PDF-1.4 notes");
    }

    SyncConfig session_config(const std::filesystem::path &root)
    {
        SyncConfig config;
        config.base_url = kHost;
        config.token = "token";
        config.root = root;
        config.selection = SelectionMode::All;
        return config;
    }

    void test_engine_idempotent()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_engine_test";
        cleanup_path(temp_root);

        FakeTransport fake;
        fake.on_path("https://files.example.edu/notes.pdf", FakeReply{.status = 200, .body = "PDFDATA"});

        auto logger = Logger::silent();
        CourtesyGate gate(no_sleep());
        PathLocks locks;
        SyncLedger ledger(temp_root);
        SyncEngine engine(fake, SyncEngineOptions{.root = temp_root, .courtesy_delay = std::chrono::milliseconds{500}},
                          gate, locks, logger, &ledger);

        const model::LeafFile file{.display_name = "notes.pdf",
                                   .source_url = "https://files.example.edu/notes.pdf?verifier=xyz",
                                   .logical_path = paths::make_logical_path("CS101", "Week 1", "notes.pdf")};
        const auto target = temp_root / "CS101" / "Week 1" / "notes.pdf";
        assert(engine.destination(file) == target);

        const auto first = engine.sync(file);
        assert(first.status == SyncStatus::Downloaded);
        assert(first.bytes == 7);
        assert(read_file(target) == "PDFDATA");
        assert(!std::filesystem::exists(paths::partial_path(target)));
        assert(gate.total_deferred() == std::chrono::milliseconds{500});
        assert(fake.call_count() == 1);

        const auto entry = ledger.find(target);
        assert(entry && entry->size == 7);
        assert(entry->source == "https://files.example.edu/notes.pdf");

        const auto second = engine.sync(file);
        assert(second.status == SyncStatus::Skipped);
        assert(fake.call_count() == 1);
        assert(gate.total_deferred() == std::chrono::milliseconds{500});
        assert(to_string(second.status) == "skipped");

        cleanup_path(temp_root);
    }

    void test_engine_failure_isolation()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_engine_failure_test";
        cleanup_path(temp_root);

        FakeTransport fake;
        fake.on_path("https://files.example.edu/broken.pdf", FakeReply{.status = 500});
        fake.on_path("https://files.example.edu/ok.pdf", FakeReply{.status = 200, .body = "fine"});

        auto logger = Logger::silent();
        CourtesyGate gate(no_sleep());
        PathLocks locks;
        SyncEngine engine(fake, SyncEngineOptions{.root = temp_root, .courtesy_delay = std::chrono::milliseconds{300}},
                          gate, locks, logger);

        const model::LeafFile broken{.display_name = "broken.pdf",
                                     .source_url = "https://files.example.edu/broken.pdf",
                                     .logical_path = paths::make_logical_path("CS101", "Week 1", "broken.pdf")};
        const model::LeafFile ok{.display_name = "ok.pdf",
                                 .source_url = "https://files.example.edu/ok.pdf",
                                 .logical_path = paths::make_logical_path("CS101", "Week 1", "ok.pdf")};

        const auto failed = engine.sync(broken);
        assert(failed.status == SyncStatus::Failed);
        assert(failed.error == ErrorCode::HttpFailure);
        assert(!failed.reason.empty());
        assert(!std::filesystem::exists(engine.destination(broken)));
        assert(!std::filesystem::exists(paths::partial_path(engine.destination(broken))));
        assert(gate.total_deferred() == std::chrono::milliseconds{0});

        const auto succeeded = engine.sync(ok);
        assert(succeeded.status == SyncStatus::Downloaded);
        assert(read_file(engine.destination(ok)) == "fine");
        assert(gate.total_deferred() == std::chrono::milliseconds{300});

        // A leftover partial file from an interrupted run is overwritten.
        const auto stale = paths::partial_path(engine.destination(broken));
        {
            std::ofstream out(stale, std::ios::binary);
            out << "stale bytes";
        }
        fake.on_path("https://files.example.edu/broken.pdf", FakeReply{.status = 200, .body = "fixed"});
        assert(engine.sync(broken).status == SyncStatus::Downloaded);
        assert(read_file(engine.destination(broken)) == "fixed");
        assert(!std::filesystem::exists(stale));
        assert(gate.total_deferred() == std::chrono::milliseconds{600});

        cleanup_path(temp_root);
    }

    void test_engine_name_collisions()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_engine_collision_test";
        cleanup_path(temp_root);

        FakeTransport fake;
        fake.on_path("https://files.example.edu/a", FakeReply{.status = 200, .body = "draft copy"});
        fake.on_path("https://files.example.edu/b", FakeReply{.status = 200, .body = "final copy"});
        fake.on_path("https://files.example.edu/c", FakeReply{.status = 200, .body = "question copy"});

        auto logger = Logger::silent();
        CourtesyGate gate(no_sleep());
        PathLocks locks;
        SyncEngine engine(fake, SyncEngineOptions{.root = temp_root}, gate, locks, logger);

        auto leaf = [](const std::string &name, const std::string &url)
        {
            return model::LeafFile{.display_name = name,
                                   .source_url = url,
                                   .logical_path = paths::make_logical_path("CS101", "Week 1", name)};
        };
        const auto part_named = leaf("notes.pdf.part", "https://files.example.edu/a");
        const auto plain = leaf("notes.pdf", "https://files.example.edu/b");
        const auto questioned = leaf("notes?.pdf", "https://files.example.edu/c");

        // A remote file whose name ends in .part must not share the temp file of its sibling.
        assert(engine.sync(part_named).status == SyncStatus::Downloaded);
        assert(engine.sync(plain).status == SyncStatus::Downloaded);
        assert(read_file(engine.destination(part_named)) == "draft copy");
        assert(read_file(engine.destination(plain)) == "final copy");
        assert(fake.call_count() == 2);

        // notes?.pdf sanitizes onto notes.pdf; the file already there wins.
        assert(engine.destination(questioned) == engine.destination(plain));
        const auto collided = engine.sync(questioned);
        assert(collided.status == SyncStatus::Skipped);
        assert(read_file(engine.destination(plain)) == "final copy");
        assert(fake.calls_to("https://files.example.edu/c") == 0);

        fake.reset_calls();
        assert(engine.sync(part_named).status == SyncStatus::Skipped);
        assert(engine.sync(plain).status == SyncStatus::Skipped);
        assert(fake.call_count() == 0);

        cleanup_path(temp_root);
    }

    void test_resolver_modules()
    {
        FakeTransport fake;
        const auto items_url = kApi + "/courses/1/modules/12/items";
        fake.on_path(kApi + "/courses/1/modules", FakeReply{.status = 200, .body = nlohmann::json::array({
            {{"id", 11}, {"name", "Week 1: Intro"}, {"items", {
                {{"type", "File"}, {"title", "notes"}, {"content_id", 10}},
                {{"type", "Page"}, {"title", "Welcome"}, {"content_id", 99}},
                {{"type", "File"}, {"title", "gone"}, {"content_id", 11}},
            }}},
            {{"id", 12}, {"name", "Week 2"}, {"items_url", items_url}},
        }).dump()});
        fake.on_path(items_url, FakeReply{.status = 200, .body = nlohmann::json::array({
            {{"type", "File"}, {"title", "hw"}, {"content_id", 12}},
        }).dump()});
        script_file(fake, 10, "notes.pdf", "n");
        fake.on_path(kApi + "/files/12",
                     FakeReply{.status = 200, .body = R"({"filename": "hw.pdf", "url": "https://canvas.example.edu/files/12/download"})"});

        auto logger = Logger::silent();
        Paginator paginator(fake);
        ModuleSource source(paginator, kApi);
        ResourceResolver resolver(fake, kApi, source, logger);

        const auto resolved = resolver.resolve(course(1, "CS101"));
        assert(!resolved.access_denied);
        assert(resolved.groups.size() == 2);
        assert(resolved.file_count() == 2);
        assert(resolved.unresolved_items == 1);

        const auto &week1 = resolved.groups[0];
        assert(week1.group.name == "Week 1: Intro");
        assert(week1.files.size() == 1);
        assert(week1.unresolved == 1);
        assert(week1.files[0].logical_path.generic_string() == "CS101/Week 1 Intro/notes.pdf");
        assert(week1.files[0].source_url == kHost + "/files/10/download?verifier=abc");

        const auto &week2 = resolved.groups[1];
        assert(week2.files.size() == 1);
        assert(week2.files[0].logical_path.generic_string() == "CS101/Week 2/hw.pdf");
        assert(fake.calls_to(kApi + "/files/99") == 0);

        FakeTransport denied;
        denied.on_path(kApi + "/courses/1/modules", FakeReply{.status = 403});
        Paginator denied_paginator(denied);
        ModuleSource denied_source(denied_paginator, kApi);
        ResourceResolver denied_resolver(denied, kApi, denied_source, logger);
        const auto skipped = denied_resolver.resolve(course(1, "CS101"));
        assert(skipped.access_denied);
        assert(skipped.groups.empty());

        FakeTransport broken;
        broken.on_path(kApi + "/courses/1/modules", FakeReply{.status = 502});
        Paginator broken_paginator(broken);
        ModuleSource broken_source(broken_paginator, kApi);
        ResourceResolver broken_resolver(broken, kApi, broken_source, logger);
        bool propagated = false;
        try
        {
            broken_resolver.resolve(course(1, "CS101"));
        }
        catch (const PaginationError &ex)
        {
            propagated = ex.status() == 502;
        }
        assert(propagated);
    }

    void test_file_metadata_errors()
    {
        FakeTransport fake;
        fake.on_path(kApi + "/files/1", FakeReply{.status = 200, .body = "[]"});
        fake.on_path(kApi + "/files/2", FakeReply{.status = 200, .body = R"({"display_name": "x.pdf"})"});
        fake.on_path(kApi + "/files/3", FakeReply{.status = 200, .body = R"({"url": "https://x/3"})"});

        auto logger = Logger::silent();
        Paginator paginator(fake);
        ModuleSource source(paginator, kApi);
        ResourceResolver resolver(fake, kApi, source, logger);

        auto code_of = [&resolver](std::int64_t id)
        {
            try
            {
                resolver.fetch_file_metadata(id);
            }
            catch (const ResolutionItemError &ex)
            {
                return ex.code();
            }
            return ErrorCode::Ok;
        };
        assert(code_of(1) == ErrorCode::ItemUnresolved);
        assert(code_of(2) == ErrorCode::ItemUnresolved);
        assert(code_of(404) == ErrorCode::ItemUnresolved);
        assert(resolver.fetch_file_metadata(3).display_name == "file_3");
    }

    void test_parse_submissions()
    {
        const std::vector<nlohmann::json> submissions{
            nlohmann::json::parse(R"({
                "assignment_id": 40,
                "assignment": {"name": "Essay"},
                "submission_history": [
                    {"attachments": [{"filename": "draft.docx", "url": "https://x/files/1/download"}]},
                    {"attachments": [{"display_name": "final.docx", "url": "https://x/files/2/download"}]}
                ],
                "attachments": [{"url": "https://x/files/3/latest.docx?download_frd=1"}]
            })"),
            nlohmann::json::parse(R"({"assignment_id": 41, "assignment": {"name": "Quiz"}})"),
            nlohmann::json::parse(R"({"assignment_id": 42, "attachments": [{"filename": "a.txt", "url": "https://x/a"}]})"),
        };

        const auto groups = parse_submissions(submissions, 7);
        assert(groups.size() == 2);
        assert(groups[0].name == "Essay");
        assert(groups[0].parent_container_id == 7);
        assert(groups[0].items.size() == 3);
        assert(groups[0].items[0].title == "draft.docx");
        assert(groups[0].items[1].title == "final.docx");
        assert(groups[0].items[2].title == "latest.docx");
        assert(groups[0].items[2].url == std::optional<std::string>("https://x/files/3/latest.docx?download_frd=1"));
        assert(groups[1].name == "assignment_42");

        const auto modules = parse_modules({nlohmann::json::parse(R"({"id": 3})"), nlohmann::json(5)}, 7);
        assert(modules.size() == 1);
        assert(modules[0].name == "Unnamed Module");
        assert(modules[0].items.empty());
    }

    void test_session_end_to_end()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_session_test";
        cleanup_path(temp_root);

        FakeTransport fake;
        script_two_courses(fake);
        const auto download = kHost + "/files/10/download";
        const auto target = temp_root / "CS101" / "Week 1" / "notes.pdf";

        auto logger = Logger::silent();
        std::istringstream no_input;
        std::ostringstream prompt_output;
        Prompt prompt(no_input, prompt_output);

        {
            SyncSession session(session_config(temp_root), logger, fake, prompt, no_sleep());
            assert(session.run() == 0);
        }
        assert(read_file(target) == "%PDF-1.4 notes");
        assert(fake.calls_to(download) == 1);
        const auto written_at = std::filesystem::last_write_time(target);

        fake.reset_calls();
        {
            SyncSession session(session_config(temp_root), logger, fake, prompt, no_sleep());
            assert(session.run() == 0);
        }
        assert(fake.calls_to(download) == 0);
        assert(std::filesystem::last_write_time(target) == written_at);
        assert(read_file(target) == "%PDF-1.4 notes");

        auto verify_config = session_config(temp_root);
        verify_config.kind = SyncKind::Verify;
        {
            SyncSession verifier(verify_config, logger, fake, prompt, no_sleep());
            assert(verifier.run() == 0);
        }
        {
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            out << "tampered";
        }
        {
            SyncSession verifier(verify_config, logger, fake, prompt, no_sleep());
            assert(verifier.run() == 1);
        }

        cleanup_path(temp_root);
    }

    void test_session_exit_codes()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_session_exit_test";
        cleanup_path(temp_root);

        auto logger = Logger::silent();
        std::istringstream no_input;
        std::ostringstream prompt_output;
        Prompt prompt(no_input, prompt_output);

        FakeTransport all_denied;
        all_denied.on(courses_url(), FakeReply{.status = 200, .body = R"([{"id": 2, "name": "Locked"}])"});
        all_denied.on_path(kApi + "/courses/2/modules", FakeReply{.status = 403});
        {
            SyncSession session(session_config(temp_root), logger, all_denied, prompt, no_sleep());
            assert(session.run() == 1);
        }

        FakeTransport no_courses;
        no_courses.on(courses_url(), FakeReply{.status = 200, .body = "[]"});
        {
            SyncSession session(session_config(temp_root), logger, no_courses, prompt, no_sleep());
            assert(session.run() == 1);
        }

        FakeTransport two;
        script_two_courses(two);
        auto bad_selection = session_config(temp_root);
        bad_selection.selection = SelectionMode::ByIndex;
        bad_selection.selection_tokens = "5";
        {
            SyncSession session(bad_selection, logger, two, prompt, no_sleep());
            assert(session.run() == 1);
        }
        assert(two.calls_to(kApi + "/courses/1/modules") == 0);

        cleanup_path(temp_root);
    }

    void test_session_selection_and_submissions()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_session_select_test";
        cleanup_path(temp_root);

        FakeTransport fake;
        script_two_courses(fake);
        fake.on_path(kApi + "/courses/1/students/submissions", FakeReply{.status = 200, .body = R"([
            {"assignment_id": 40, "assignment": {"name": "Essay"},
             "attachments": [{"filename": "essay.docx", "url": "https://canvas.example.edu/files/50/download"}]}
        ])"});
        fake.on_path(kHost + "/files/50/download", FakeReply{.status = 200, .body = "essay"});

        auto logger = Logger::silent();
        std::istringstream answers("2\n1\n");
        std::ostringstream prompt_output;
        Prompt prompt(answers, prompt_output);

        auto config = session_config(temp_root);
        config.kind = SyncKind::Submissions;
        config.selection.reset();
        {
            SyncSession session(config, logger, fake, prompt, no_sleep());
            const auto chosen = session.choose_courses({course(1, "CS101"), course(2, "Locked")});
            assert(chosen.size() == 1 && chosen[0].id == 1);

            const auto summary = session.sync_courses(chosen);
            assert(summary.containers_selected == 1);
            assert(summary.containers_synced == 1);
            assert(summary.downloaded == 1);
            assert(summary.bytes == 5);
        }
        assert(read_file(temp_root / "submissions" / "CS101" / "Essay" / "essay.docx") == "essay");
        assert(fake.calls_to(kApi + "/courses/2/students/submissions") == 0);

        cleanup_path(temp_root);
    }

    void test_session_parallel_workers()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "coursesync_session_jobs_test";
        cleanup_path(temp_root);

        FakeTransport fake;
        std::vector<model::Course> courses;
        for (std::int64_t id = 1; id <= 6; ++id)
        {
            const auto name = "Course " + std::to_string(id);
            courses.push_back(course(id, name));
            fake.on_path(kApi + "/courses/" + std::to_string(id) + "/modules",
                         FakeReply{.status = 200, .body = module_with_file(100 + id, "Slides", 200 + id)});
            script_file(fake, 200 + id, "deck.pdf", "deck " + std::to_string(id));
        }
        fake.on_path(kApi + "/courses/4/modules", FakeReply{.status = 500});

        auto logger = Logger::silent();
        std::istringstream no_input;
        std::ostringstream prompt_output;
        Prompt prompt(no_input, prompt_output);
        auto config = session_config(temp_root);
        config.jobs = 3;

        SyncSession session(config, logger, fake, prompt, no_sleep());
        const auto summary = session.sync_courses(courses);
        assert(summary.containers_selected == 6);
        assert(summary.containers_synced == 5);
        assert(summary.containers_failed == 1);
        assert(summary.downloaded == 5);
        assert(summary.failed == 0);
        for (std::int64_t id = 1; id <= 6; ++id)
        {
            const auto path = temp_root / ("Course " + std::to_string(id)) / "Slides" / "deck.pdf";
            assert(std::filesystem::exists(path) == (id != 4));
        }

        const auto again = session.sync_courses(courses);
        assert(again.downloaded == 0);
        assert(again.skipped == 5);

        cleanup_path(temp_root);
    }

} // namespace

void run_sync_pipeline_tests()
{
    test_engine_idempotent();
    test_engine_failure_isolation();
    test_engine_name_collisions();
    test_resolver_modules();
    test_file_metadata_errors();
    test_parse_submissions();
    test_session_end_to_end();
    test_session_exit_codes();
    test_session_selection_and_submissions();
    test_session_parallel_workers();
}
