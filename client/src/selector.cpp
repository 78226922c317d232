#include "coursesync/client/selector.hpp"

#include <algorithm>
#include <set>

#include "coursesync/errors.hpp"

namespace coursesync::client
{

    namespace
    {

        std::vector<std::string> split_tokens(std::string_view input)
        {
            std::vector<std::string> tokens;
            std::string current;
            for (const char c : input)
            {
                if (c == ',' || c == ' ' || c == '\t' || c == '\n' || c == '\r')
                {
                    if (!current.empty())
                    {
                        tokens.push_back(std::move(current));
                        current.clear();
                    }
                    continue;
                }
                current.push_back(c);
            }
            if (!current.empty())
            {
                tokens.push_back(std::move(current));
            }
            return tokens;
        }

        std::vector<model::Course> courses_in_terms(const std::vector<model::Course> &courses,
                                                    const std::set<std::string> &terms)
        {
            std::vector<model::Course> result;
            for (const auto &course : courses)
            {
                if (course.term && terms.count(course.term->name) > 0)
                {
                    result.push_back(course);
                }
            }
            return result;
        }

    } // namespace

    std::string_view to_string(SelectionMode mode) noexcept
    {
        switch (mode)
        {
        case SelectionMode::All:
            return "all";
        case SelectionMode::ByIndex:
            return "by_index";
        case SelectionMode::CurrentTerm:
            return "current_term";
        case SelectionMode::ByTerm:
            return "by_term";
        }
        return "unknown";
    }

    std::vector<std::size_t> parse_indices(std::string_view tokens, std::size_t count)
    {
        const auto parts = split_tokens(tokens);
        if (parts.empty())
        {
            throw SelectionError(ErrorCode::EmptySelection, "No selection given");
        }

        std::vector<std::size_t> positions;
        std::set<std::size_t> seen;
        for (const auto &part : parts)
        {
            if (!std::all_of(part.begin(), part.end(), [](char c)
                             { return c >= '0' && c <= '9'; }) ||
                part.size() > 9)
            {
                throw SelectionError(ErrorCode::InvalidSelection, "Not a number: '" + part + "'");
            }
            const auto value = static_cast<std::size_t>(std::stoul(part));
            if (value < 1 || value > count)
            {
                throw SelectionError(ErrorCode::InvalidSelection,
                                     "Selection " + part + " is out of range 1-" + std::to_string(count));
            }
            if (seen.insert(value - 1).second)
            {
                positions.push_back(value - 1);
            }
        }
        return positions;
    }

    std::vector<model::Term> collect_terms(const std::vector<model::Course> &courses)
    {
        std::vector<model::Term> terms;
        std::set<std::string> names;
        for (const auto &course : courses)
        {
            if (!course.term || course.term->name.empty())
            {
                continue;
            }
            if (names.insert(course.term->name).second)
            {
                terms.push_back(*course.term);
            }
        }
        std::sort(terms.begin(), terms.end(), [](const model::Term &lhs, const model::Term &rhs)
                  { return lhs.name < rhs.name; });
        return terms;
    }

    std::optional<std::string> detect_current_term(const std::vector<model::Course> &courses, model::TimePoint now)
    {
        for (const auto &course : courses)
        {
            if (course.term && !course.term->name.empty() && course.term->contains(now))
            {
                return course.term->name;
            }
        }
        return std::nullopt;
    }

    std::vector<model::Course> select(const std::vector<model::Course> &courses, SelectionMode mode,
                                      const std::optional<std::string> &explicit_indices, model::TimePoint now)
    {
        switch (mode)
        {
        case SelectionMode::All:
            return courses;
        case SelectionMode::ByIndex:
        {
            std::vector<model::Course> result;
            for (const auto position : parse_indices(explicit_indices.value_or(std::string{}), courses.size()))
            {
                result.push_back(courses[position]);
            }
            return result;
        }
        case SelectionMode::CurrentTerm:
        {
            const auto current = detect_current_term(courses, now);
            if (!current)
            {
                return {};
            }
            return courses_in_terms(courses, {*current});
        }
        case SelectionMode::ByTerm:
        {
            const auto terms = collect_terms(courses);
            std::set<std::string> chosen;
            for (const auto position : parse_indices(explicit_indices.value_or(std::string{}), terms.size()))
            {
                chosen.insert(terms[position].name);
            }
            return courses_in_terms(courses, chosen);
        }
        }
        throw SelectionError(ErrorCode::InvalidSelection, "Unknown selection mode");
    }

} // namespace coursesync::client
