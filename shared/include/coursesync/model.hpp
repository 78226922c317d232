/**
 * coursesync - Entities fetched from the course service and their JSON decoding.
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

namespace coursesync::model
{

    using TimePoint = std::chrono::system_clock::time_point;

    // Accepts "2024-09-23T07:00:00Z", fractional seconds and +hh:mm offsets.
    std::optional<TimePoint> parse_timestamp(std::string_view text);

    struct Term
    {
        std::string name;
        std::optional<TimePoint> start_at{};
        std::optional<TimePoint> end_at{};

        // False when either bound is unknown.
        bool contains(TimePoint instant) const noexcept;
    };

    void from_json(const nlohmann::json &json, Term &term);

    struct Course
    {
        std::int64_t id{};
        std::string name;
        std::string course_code;
        std::string workflow_state;
        std::optional<Term> term{};
        std::vector<std::string> enrollment_states;

        std::string term_name() const;
    };

    void from_json(const nlohmann::json &json, Course &course);

    enum class ItemKind : std::uint8_t
    {
        File,
        Other
    };

    std::string_view to_string(ItemKind kind) noexcept;

    // Either content_id (module items, resolved through /files/{id}) or url
    // (submission attachments, directly downloadable) is set for File items.
    struct ItemRef
    {
        ItemKind kind{ItemKind::Other};
        std::string title;
        std::optional<std::int64_t> content_id{};
        std::optional<std::string> url{};
    };

    void from_json(const nlohmann::json &json, ItemRef &item);

    struct SubContainer
    {
        std::int64_t id{};
        std::string name;
        std::int64_t parent_container_id{};
        std::vector<ItemRef> items;
    };

    struct FileMetadata
    {
        std::string display_name;
        std::string url;
    };

    void from_json(const nlohmann::json &json, FileMetadata &metadata);

    struct LeafFile
    {
        std::string display_name;
        std::string source_url;
        std::filesystem::path logical_path;
    };

    std::string string_field(const nlohmann::json &json, const char *key, std::string fallback = {});

} // namespace coursesync::model
