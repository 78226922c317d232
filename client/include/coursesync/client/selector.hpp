/**
 * coursesync - Pure selection of the courses a run should process.
 *
 * Nothing here performs I/O; the interactive prompt and the command line flags
 * both reduce to a mode plus an optional index string.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "coursesync/model.hpp"

namespace coursesync::client
{

    enum class SelectionMode : std::uint8_t
    {
        All,
        ByIndex,
        CurrentTerm,
        ByTerm
    };

    std::string_view to_string(SelectionMode mode) noexcept;

    /**
     * Converts 1-based indices separated by whitespace or commas into 0-based
     * positions, keeping first occurrences only. Throws SelectionError for empty
     * input, non-numeric tokens, or indices outside [1, count].
     */
    std::vector<std::size_t> parse_indices(std::string_view tokens, std::size_t count);

    // Distinct named terms, sorted by name. Courses without a term are not represented.
    std::vector<model::Term> collect_terms(const std::vector<model::Course> &courses);

    // First term (in course order) whose interval contains now.
    std::optional<std::string> detect_current_term(const std::vector<model::Course> &courses, model::TimePoint now);

    /**
     * All: every course. ByIndex: indices into courses. ByTerm: indices into
     * collect_terms(courses). CurrentTerm: courses of the detected term, or an
     * empty result when no term is current (callers fall back to ByTerm).
     */
    std::vector<model::Course> select(const std::vector<model::Course> &courses, SelectionMode mode,
                                      const std::optional<std::string> &explicit_indices = std::nullopt,
                                      model::TimePoint now = std::chrono::system_clock::now());

} // namespace coursesync::client
