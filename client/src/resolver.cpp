#include "coursesync/client/resolver.hpp"

#include <utility>

#include "coursesync/errors.hpp"
#include "coursesync/paths.hpp"

namespace coursesync::client
{

    std::size_t ResolvedContainer::file_count() const
    {
        std::size_t count = 0;
        for (const auto &group : groups)
        {
            count += group.files.size();
        }
        return count;
    }

    ResourceResolver::ResourceResolver(Transport &transport, std::string api_root, GroupSource &source,
                                       Logger &logger)
        : transport_(transport), api_root_(std::move(api_root)), source_(source), logger_(logger) {}

    ResolvedContainer ResourceResolver::resolve(const model::Course &course)
    {
        ResolvedContainer resolved;
        resolved.course = course;

        std::vector<model::SubContainer> groups;
        try
        {
            groups = source_.fetch_groups(course);
        }
        catch (const TransportError &ex)
        {
            if (!ex.access_denied())
            {
                throw;
            }
            logger_.warn("resolver", "Cannot access ", source_.name(), " for course ", course.id, " (", course.name,
                         "), skipping");
            resolved.access_denied = true;
            return resolved;
        }

        for (auto &group : groups)
        {
            ResolvedGroup entry;
            for (const auto &item : group.items)
            {
                if (item.kind != model::ItemKind::File)
                {
                    continue;
                }
                try
                {
                    entry.files.push_back(resolve_item(course, group, item));
                }
                catch (const Error &ex)
                {
                    ++entry.unresolved;
                    logger_.warn("resolver", "Could not resolve '", item.title, "' in ", course.name, "/", group.name,
                                 ": ", ex.what());
                }
                catch (const nlohmann::json::exception &ex)
                {
                    ++entry.unresolved;
                    logger_.warn("resolver", "Malformed metadata for '", item.title, "' in ", course.name, "/",
                                 group.name, ": ", ex.what());
                }
            }
            resolved.unresolved_items += entry.unresolved;
            logger_.debug("resolver", course.name, "/", group.name, ": ", entry.files.size(), " file(s)");
            entry.group = std::move(group);
            resolved.groups.push_back(std::move(entry));
        }
        return resolved;
    }

    model::FileMetadata ResourceResolver::fetch_file_metadata(std::int64_t content_id)
    {
        const auto url = api_root_ + "/files/" + std::to_string(content_id);
        HttpResponse response;
        try
        {
            response = transport_.get(url);
        }
        catch (const TransportError &ex)
        {
            throw ResolutionItemError("metadata request for file " + std::to_string(content_id) +
                                      " failed: " + ex.what());
        }

        const auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object())
        {
            throw ResolutionItemError("metadata for file " + std::to_string(content_id) + " is not a JSON object");
        }
        auto metadata = body.get<model::FileMetadata>();
        if (metadata.url.empty())
        {
            throw ResolutionItemError("file " + std::to_string(content_id) + " has no download url");
        }
        if (metadata.display_name.empty())
        {
            metadata.display_name = "file_" + std::to_string(content_id);
        }
        return metadata;
    }

    model::LeafFile ResourceResolver::resolve_item(const model::Course &course, const model::SubContainer &group,
                                                   const model::ItemRef &item)
    {
        model::LeafFile leaf;
        if (item.url)
        {
            leaf.display_name = item.title;
            leaf.source_url = *item.url;
        }
        else if (item.content_id)
        {
            auto metadata = fetch_file_metadata(*item.content_id);
            leaf.display_name = std::move(metadata.display_name);
            leaf.source_url = std::move(metadata.url);
        }
        else
        {
            throw ResolutionItemError("item has neither a content id nor a url");
        }
        leaf.logical_path = paths::make_logical_path(course.name, group.name, leaf.display_name);
        return leaf;
    }

} // namespace coursesync::client
