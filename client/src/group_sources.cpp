#include "coursesync/client/resolver.hpp"

#include <utility>

namespace coursesync::client
{

    namespace
    {

        std::int64_t id_field(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_number_integer())
            {
                return 0;
            }
            return it->get<std::int64_t>();
        }

        std::string last_url_segment(const std::string &url)
        {
            auto path = url.substr(0, url.find_first_of("?#"));
            while (!path.empty() && path.back() == '/')
            {
                path.pop_back();
            }
            const auto slash = path.rfind('/');
            return slash == std::string::npos ? path : path.substr(slash + 1);
        }

        void append_attachments(const nlohmann::json &holder, std::vector<model::ItemRef> &items)
        {
            const auto it = holder.find("attachments");
            if (it == holder.end() || !it->is_array())
            {
                return;
            }
            for (const auto &attachment : *it)
            {
                model::ItemRef item;
                item.kind = model::ItemKind::File;
                auto url = model::string_field(attachment, "url");
                item.title = model::string_field(attachment, "filename",
                                                 model::string_field(attachment, "display_name",
                                                                     last_url_segment(url)));
                if (!url.empty())
                {
                    item.url = std::move(url);
                }
                items.push_back(std::move(item));
            }
        }

        std::vector<model::ItemRef> parse_items(const nlohmann::json &items)
        {
            std::vector<model::ItemRef> result;
            if (!items.is_array())
            {
                return result;
            }
            for (const auto &item : items)
            {
                if (item.is_object())
                {
                    result.push_back(item.get<model::ItemRef>());
                }
            }
            return result;
        }

    } // namespace

    std::vector<model::SubContainer> parse_modules(const std::vector<nlohmann::json> &modules,
                                                   std::int64_t course_id)
    {
        std::vector<model::SubContainer> groups;
        groups.reserve(modules.size());
        for (const auto &module : modules)
        {
            if (!module.is_object())
            {
                continue;
            }
            model::SubContainer group;
            group.id = id_field(module, "id");
            group.name = model::string_field(module, "name", "Unnamed Module");
            group.parent_container_id = course_id;
            if (const auto it = module.find("items"); it != module.end())
            {
                group.items = parse_items(*it);
            }
            groups.push_back(std::move(group));
        }
        return groups;
    }

    std::vector<model::SubContainer> parse_submissions(const std::vector<nlohmann::json> &submissions,
                                                       std::int64_t course_id)
    {
        std::vector<model::SubContainer> groups;
        for (const auto &submission : submissions)
        {
            if (!submission.is_object())
            {
                continue;
            }
            model::SubContainer group;
            group.id = id_field(submission, "assignment_id");
            group.parent_container_id = course_id;
            const auto assignment = submission.value("assignment", nlohmann::json::object());
            group.name = model::string_field(assignment, "name", "assignment_" + std::to_string(group.id));

            if (const auto history = submission.find("submission_history");
                history != submission.end() && history->is_array())
            {
                for (const auto &attempt : *history)
                {
                    append_attachments(attempt, group.items);
                }
            }
            append_attachments(submission, group.items);

            if (!group.items.empty())
            {
                groups.push_back(std::move(group));
            }
        }
        return groups;
    }

    ModuleSource::ModuleSource(Paginator &paginator, std::string api_root)
        : paginator_(paginator), api_root_(std::move(api_root)) {}

    std::vector<model::SubContainer> ModuleSource::fetch_groups(const model::Course &course)
    {
        const auto url = api_root_ + "/courses/" + std::to_string(course.id) + "/modules";
        const auto modules = paginator_.fetch_all(url, {{"include[]", "items"}}, PaginationStyle::LinkHeader);
        auto groups = parse_modules(modules, course.id);

        // Large modules come back without inline items, only an items_url.
        std::size_t index = 0;
        for (const auto &module : modules)
        {
            if (!module.is_object())
            {
                continue;
            }
            auto &group = groups[index++];
            const auto items_url = model::string_field(module, "items_url");
            if (module.contains("items") || items_url.empty())
            {
                continue;
            }
            const auto items = paginator_.fetch_all(items_url, {}, PaginationStyle::LinkHeader);
            group.items = parse_items(nlohmann::json(items));
        }
        return groups;
    }

    SubmissionSource::SubmissionSource(Paginator &paginator, std::string api_root)
        : paginator_(paginator), api_root_(std::move(api_root)) {}

    std::vector<model::SubContainer> SubmissionSource::fetch_groups(const model::Course &course)
    {
        const auto url = api_root_ + "/courses/" + std::to_string(course.id) + "/students/submissions";
        const QueryParams params{
            {"student_ids[]", "self"},
            {"include[]", "submission_history"},
            {"include[]", "assignment"},
        };
        return parse_submissions(paginator_.fetch_all(url, params, PaginationStyle::LinkHeader), course.id);
    }

} // namespace coursesync::client
