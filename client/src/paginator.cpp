#include "coursesync/client/paginator.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

#include "coursesync/errors.hpp"

namespace coursesync::client
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        bool has_next_relation(std::string_view params)
        {
            while (!params.empty())
            {
                const auto semicolon = params.find(';');
                auto param = trim(params.substr(0, semicolon));
                params = semicolon == std::string_view::npos ? std::string_view{} : params.substr(semicolon + 1);

                const auto eq = param.find('=');
                if (eq == std::string_view::npos)
                {
                    continue;
                }
                auto name = trim(param.substr(0, eq));
                if (name.size() != 3 || std::tolower(static_cast<unsigned char>(name[0])) != 'r' ||
                    std::tolower(static_cast<unsigned char>(name[1])) != 'e' ||
                    std::tolower(static_cast<unsigned char>(name[2])) != 'l')
                {
                    continue;
                }
                auto value = trim(param.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                {
                    value = value.substr(1, value.size() - 2);
                }
                // rel may hold several space separated relation types.
                while (!value.empty())
                {
                    const auto space = value.find(' ');
                    if (trim(value.substr(0, space)) == "next")
                    {
                        return true;
                    }
                    value = space == std::string_view::npos ? std::string_view{} : value.substr(space + 1);
                }
            }
            return false;
        }

        QueryParams first_page_params(const QueryParams &base_params, std::size_t per_page)
        {
            QueryParams params;
            for (const auto &param : base_params)
            {
                if (param.first != "per_page" && param.first != "page")
                {
                    params.push_back(param);
                }
            }
            params.emplace_back("per_page", std::to_string(per_page));
            return params;
        }

        void append_page(std::vector<nlohmann::json> &results, nlohmann::json page)
        {
            if (page.is_array())
            {
                for (auto &element : page)
                {
                    results.push_back(std::move(element));
                }
            }
            else if (!page.is_null())
            {
                results.push_back(std::move(page));
            }
        }

    } // namespace

    std::optional<std::string> next_link(std::string_view link_header)
    {
        std::size_t position = 0;
        while (position < link_header.size())
        {
            const auto open = link_header.find('<', position);
            if (open == std::string_view::npos)
            {
                break;
            }
            const auto close = link_header.find('>', open);
            if (close == std::string_view::npos)
            {
                break;
            }
            const auto target = link_header.substr(open + 1, close - open - 1);
            auto end = link_header.find('<', close);
            auto params = link_header.substr(close + 1, end == std::string_view::npos ? std::string_view::npos
                                                                                       : end - close - 1);
            if (const auto comma = params.rfind(','); comma != std::string_view::npos)
            {
                params = params.substr(0, comma);
            }
            if (has_next_relation(params))
            {
                return std::string(trim(target));
            }
            position = close + 1;
        }
        return std::nullopt;
    }

    Paginator::Paginator(Transport &transport, std::size_t per_page)
        : transport_(transport), per_page_(std::max<std::size_t>(per_page, 1)) {}

    std::vector<nlohmann::json> Paginator::fetch_all(const std::string &url, const QueryParams &base_params,
                                                     PaginationStyle style)
    {
        if (style == PaginationStyle::LinkHeader)
        {
            return fetch_linked(url, base_params);
        }
        return fetch_counted(url, base_params);
    }

    std::vector<nlohmann::json> Paginator::fetch_linked(const std::string &url, const QueryParams &base_params)
    {
        std::vector<nlohmann::json> results;
        std::set<std::string> visited;
        std::optional<std::string> next_url = url;
        QueryParams params = first_page_params(base_params, per_page_);
        std::size_t page = 1;

        while (next_url)
        {
            const auto current = *next_url;
            if (!visited.insert(build_url(current, params)).second)
            {
                throw PaginationError(0, current, page, "Pagination loop detected at " + current);
            }
            append_page(results, fetch_page(current, params, page, &next_url));
            // The continuation URL already encodes every parameter.
            params.clear();
            ++page;
        }
        return results;
    }

    std::vector<nlohmann::json> Paginator::fetch_counted(const std::string &url, const QueryParams &base_params)
    {
        std::vector<nlohmann::json> results;
        const auto base = first_page_params(base_params, per_page_);

        for (std::size_t page = 1;; ++page)
        {
            auto params = base;
            params.emplace_back("page", std::to_string(page));
            auto batch = fetch_page(url, params, page, nullptr);
            const std::size_t count = batch.is_array() ? batch.size() : (batch.is_null() ? 0 : 1);
            append_page(results, std::move(batch));
            if (count < per_page_)
            {
                break;
            }
        }
        return results;
    }

    nlohmann::json Paginator::fetch_page(const std::string &url, const QueryParams &params, std::size_t page,
                                         std::optional<std::string> *next)
    {
        HttpResponse response;
        try
        {
            response = transport_.get(url, params);
        }
        catch (const TransportError &ex)
        {
            throw PaginationError(ex.status(), ex.url(), page,
                                  "Page " + std::to_string(page) + " of " + url + " failed: " + ex.what());
        }

        if (next != nullptr)
        {
            const auto link = response.header("link");
            *next = link ? next_link(*link) : std::nullopt;
        }

        if (response.body.empty())
        {
            return nlohmann::json::array();
        }
        try
        {
            return nlohmann::json::parse(response.body);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw PaginationError(response.status, url, page,
                                  "Page " + std::to_string(page) + " of " + url + " is not valid JSON: " + ex.what());
        }
    }

} // namespace coursesync::client
