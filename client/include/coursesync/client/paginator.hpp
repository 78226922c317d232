#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "coursesync/client/transport.hpp"

namespace coursesync::client
{

    enum class PaginationStyle : std::uint8_t
    {
        // Follow rel="next" from the Link header until it disappears.
        LinkHeader,
        // Request page=1,2,... until a page holds fewer than per_page elements.
        PageCounter
    };

    inline constexpr std::size_t kDefaultPerPage = 100;

    // Extracts the rel="next" target from an RFC 8288 Link header value.
    std::optional<std::string> next_link(std::string_view link_header);

    class Paginator
    {
    public:
        explicit Paginator(Transport &transport, std::size_t per_page = kDefaultPerPage);

        /**
         * Returns every element of the collection exactly once, in server order.
         * Throws PaginationError if any page fails; nothing is returned in that case.
         */
        std::vector<nlohmann::json> fetch_all(const std::string &url, const QueryParams &base_params,
                                              PaginationStyle style);

        std::size_t per_page() const noexcept { return per_page_; }

    private:
        std::vector<nlohmann::json> fetch_linked(const std::string &url, const QueryParams &base_params);
        std::vector<nlohmann::json> fetch_counted(const std::string &url, const QueryParams &base_params);
        nlohmann::json fetch_page(const std::string &url, const QueryParams &params, std::size_t page,
                                  std::optional<std::string> *next);

        Transport &transport_;
        std::size_t per_page_;
    };

} // namespace coursesync::client
