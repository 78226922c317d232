/**
 * coursesync - Resolution of a course into named groups of downloadable files.
 *
 * A GroupSource knows how to list a course's sub-containers (modules with their
 * items, or assignment submissions with their attachments). The resolver turns
 * those item references into LeafFiles, isolating failures to the smallest unit
 * that can fail on its own: a 403 skips the course, a bad item skips the item.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "coursesync/client/logger.hpp"
#include "coursesync/client/paginator.hpp"
#include "coursesync/client/transport.hpp"
#include "coursesync/model.hpp"

namespace coursesync::client
{

    class GroupSource
    {
    public:
        virtual ~GroupSource() = default;

        virtual std::string_view name() const = 0;

        // Directory under the download root that this source writes into.
        virtual std::filesystem::path root_prefix() const = 0;

        virtual std::chrono::milliseconds courtesy_delay() const = 0;

        // Throws TransportError (AccessDenied / PaginationError) when the listing fails.
        virtual std::vector<model::SubContainer> fetch_groups(const model::Course &course) = 0;
    };

    std::vector<model::SubContainer> parse_modules(const std::vector<nlohmann::json> &modules,
                                                   std::int64_t course_id);

    std::vector<model::SubContainer> parse_submissions(const std::vector<nlohmann::json> &submissions,
                                                       std::int64_t course_id);

    // GET /courses/{id}/modules?include[]=items
    class ModuleSource : public GroupSource
    {
    public:
        ModuleSource(Paginator &paginator, std::string api_root);

        std::string_view name() const override { return "modules"; }
        std::filesystem::path root_prefix() const override { return {}; }
        std::chrono::milliseconds courtesy_delay() const override { return std::chrono::milliseconds{500}; }

        std::vector<model::SubContainer> fetch_groups(const model::Course &course) override;

    private:
        Paginator &paginator_;
        std::string api_root_;
    };

    // GET /courses/{id}/students/submissions for the current user, with history and assignment.
    class SubmissionSource : public GroupSource
    {
    public:
        SubmissionSource(Paginator &paginator, std::string api_root);

        std::string_view name() const override { return "submissions"; }
        std::filesystem::path root_prefix() const override { return "submissions"; }
        std::chrono::milliseconds courtesy_delay() const override { return std::chrono::milliseconds{200}; }

        std::vector<model::SubContainer> fetch_groups(const model::Course &course) override;

    private:
        Paginator &paginator_;
        std::string api_root_;
    };

    struct ResolvedGroup
    {
        model::SubContainer group;
        std::vector<model::LeafFile> files;
        std::size_t unresolved{};
    };

    struct ResolvedContainer
    {
        model::Course course;
        bool access_denied{};
        std::vector<ResolvedGroup> groups;
        std::size_t unresolved_items{};

        std::size_t file_count() const;
    };

    class ResourceResolver
    {
    public:
        ResourceResolver(Transport &transport, std::string api_root, GroupSource &source, Logger &logger);

        // Only non-403 listing failures escape; everything narrower is logged and counted.
        ResolvedContainer resolve(const model::Course &course);

        // GET /files/{id}. Throws ResolutionItemError.
        model::FileMetadata fetch_file_metadata(std::int64_t content_id);

    private:
        model::LeafFile resolve_item(const model::Course &course, const model::SubContainer &group,
                                     const model::ItemRef &item);

        Transport &transport_;
        std::string api_root_;
        GroupSource &source_;
        Logger &logger_;
    };

} // namespace coursesync::client
