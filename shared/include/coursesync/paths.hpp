/**
 * coursesync - Conversion of remote display names into safe local path segments.
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace coursesync::paths
{

    // Segment used when nothing survives sanitization.
    inline constexpr std::string_view kUnnamedSegment = "unnamed";

    std::string sanitize_segment(std::string_view raw);

    std::filesystem::path make_logical_path(std::string_view container, std::string_view group,
                                            std::string_view file);

    // '~' never survives sanitize_segment, so no synced file can land on a partial path.
    inline constexpr std::string_view kPartialSuffix = "~part";

    // Sibling path the engine streams into before renaming onto the destination.
    std::filesystem::path partial_path(const std::filesystem::path &destination);

} // namespace coursesync::paths
