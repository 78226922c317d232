#include "coursesync/model.hpp"

#include <cstdio>
#include <string>

namespace coursesync::model
{

    namespace
    {

        std::optional<TimePoint> optional_timestamp(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_string())
            {
                return std::nullopt;
            }
            return parse_timestamp(it->get<std::string>());
        }

        std::int64_t integer_field(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_number_integer())
            {
                return 0;
            }
            return it->get<std::int64_t>();
        }

    } // namespace

    std::optional<TimePoint> parse_timestamp(std::string_view text)
    {
        const std::string input(text);
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;
        int consumed = 0;
        if (std::sscanf(input.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                        &consumed) != 6)
        {
            return std::nullopt;
        }

        const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{month},
                                               std::chrono::day{day}};
        if (!date.ok() || hour > 23 || minute > 59 || second > 60)
        {
            return std::nullopt;
        }

        auto rest = std::string_view(input).substr(static_cast<std::size_t>(consumed));
        if (!rest.empty() && rest.front() == '.')
        {
            rest.remove_prefix(1);
            while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9')
            {
                rest.remove_prefix(1);
            }
        }

        std::chrono::minutes offset{0};
        if (!rest.empty() && (rest.front() == '+' || rest.front() == '-'))
        {
            const int sign = rest.front() == '-' ? -1 : 1;
            const std::string zone(rest.substr(1));
            int offset_hours = 0;
            int offset_minutes = 0;
            if (std::sscanf(zone.c_str(), "%2d:%2d", &offset_hours, &offset_minutes) != 2 &&
                std::sscanf(zone.c_str(), "%2d%2d", &offset_hours, &offset_minutes) != 2)
            {
                return std::nullopt;
            }
            offset = std::chrono::minutes{sign * (offset_hours * 60 + offset_minutes)};
        }
        else if (!rest.empty() && rest != "Z" && rest != "z")
        {
            return std::nullopt;
        }

        const auto local = std::chrono::sys_days{date} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
                           std::chrono::seconds{second};
        return std::chrono::time_point_cast<TimePoint::duration>(local - offset);
    }

    bool Term::contains(TimePoint instant) const noexcept
    {
        return start_at && end_at && *start_at <= instant && instant <= *end_at;
    }

    void from_json(const nlohmann::json &json, Term &term)
    {
        term.name = string_field(json, "name");
        term.start_at = optional_timestamp(json, "start_at");
        term.end_at = optional_timestamp(json, "end_at");
    }

    std::string Course::term_name() const
    {
        if (term && !term->name.empty())
        {
            return term->name;
        }
        return "No Term";
    }

    void from_json(const nlohmann::json &json, Course &course)
    {
        course.id = integer_field(json, "id");
        course.name = string_field(json, "name", "course_" + std::to_string(course.id));
        course.course_code = string_field(json, "course_code");
        course.workflow_state = string_field(json, "workflow_state");
        course.term.reset();
        if (const auto it = json.find("term"); it != json.end() && it->is_object())
        {
            course.term = it->get<Term>();
        }
        course.enrollment_states.clear();
        if (const auto it = json.find("enrollments"); it != json.end() && it->is_array())
        {
            for (const auto &enrollment : *it)
            {
                auto state = string_field(enrollment, "enrollment_state");
                if (!state.empty())
                {
                    course.enrollment_states.push_back(std::move(state));
                }
            }
        }
    }

    std::string_view to_string(ItemKind kind) noexcept
    {
        return kind == ItemKind::File ? "File" : "Other";
    }

    void from_json(const nlohmann::json &json, ItemRef &item)
    {
        item.title = string_field(json, "title");
        item.kind = string_field(json, "type") == "File" ? ItemKind::File : ItemKind::Other;
        item.content_id.reset();
        item.url.reset();
        if (const auto it = json.find("content_id"); it != json.end() && it->is_number_integer())
        {
            item.content_id = it->get<std::int64_t>();
        }
        if (item.kind == ItemKind::File && !item.content_id)
        {
            item.kind = ItemKind::Other;
        }
    }

    void from_json(const nlohmann::json &json, FileMetadata &metadata)
    {
        metadata.display_name = string_field(json, "display_name");
        if (metadata.display_name.empty())
        {
            metadata.display_name = string_field(json, "filename");
        }
        metadata.url = string_field(json, "url");
    }

    std::string string_field(const nlohmann::json &json, const char *key, std::string fallback)
    {
        if (!json.is_object())
        {
            return fallback;
        }
        const auto it = json.find(key);
        if (it == json.end() || !it->is_string())
        {
            return fallback;
        }
        auto value = it->get<std::string>();
        return value.empty() ? fallback : value;
    }

} // namespace coursesync::model
