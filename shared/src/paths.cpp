#include "coursesync/paths.hpp"

#include <algorithm>

namespace coursesync::paths
{

    namespace
    {

        bool is_ascii_alnum(unsigned char c)
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        // Bytes of multi-byte UTF-8 sequences are kept so accented names survive.
        bool is_allowed(unsigned char c)
        {
            return is_ascii_alnum(c) || c == ' ' || c == '.' || c == '_' || c == '-' || c >= 0x80;
        }

    } // namespace

    std::string sanitize_segment(std::string_view raw)
    {
        std::string result;
        result.reserve(raw.size());
        for (const char ch : raw)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c == '/' || c == '\\')
            {
                result.push_back('-');
            }
            else if (is_allowed(c))
            {
                result.push_back(ch);
            }
        }

        const auto first = result.find_first_not_of(' ');
        if (first == std::string::npos)
        {
            return std::string(kUnnamedSegment);
        }
        const auto last = result.find_last_not_of(' ');
        result = result.substr(first, last - first + 1);

        if (std::all_of(result.begin(), result.end(), [](char c)
                        { return c == '.'; }))
        {
            return std::string(kUnnamedSegment);
        }
        return result;
    }

    std::filesystem::path make_logical_path(std::string_view container, std::string_view group,
                                            std::string_view file)
    {
        return std::filesystem::path(sanitize_segment(container)) / sanitize_segment(group) / sanitize_segment(file);
    }

    std::filesystem::path partial_path(const std::filesystem::path &destination)
    {
        auto part = destination;
        part += kPartialSuffix;
        return part;
    }

} // namespace coursesync::paths
