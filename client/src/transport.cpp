#include "coursesync/client/transport.hpp"

#include <cctype>

#include "coursesync/errors.hpp"

namespace coursesync::client
{

    std::string_view to_string(HttpMethod method) noexcept
    {
        return method == HttpMethod::Head ? "HEAD" : "GET";
    }

    std::optional<std::string> HttpResponse::header(std::string_view name) const
    {
        std::string key;
        key.reserve(name.size());
        for (const char c : name)
        {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        const auto it = headers.find(key);
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    HttpResponse Transport::get(const std::string &url, const QueryParams &query)
    {
        return request(HttpRequest{.method = HttpMethod::Get, .url = url, .query = query, .sink = {}});
    }

    std::string percent_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                encoded.push_back(ch);
            }
            else
            {
                encoded.push_back('%');
                encoded.push_back(kHexDigits[(c >> 4) & 0x0F]);
                encoded.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return encoded;
    }

    std::string build_url(const std::string &url, const QueryParams &query)
    {
        if (query.empty())
        {
            return url;
        }
        std::string result = url;
        char separator = url.find('?') == std::string::npos ? '?' : '&';
        for (const auto &[key, value] : query)
        {
            result.push_back(separator);
            result += percent_encode(key);
            result.push_back('=');
            result += percent_encode(value);
            separator = '&';
        }
        return result;
    }

    void throw_for_status(long status, const std::string &url)
    {
        if (status >= 200 && status < 300)
        {
            return;
        }
        if (status == 403)
        {
            throw AccessDenied(url);
        }
        throw TransportError(status, url, "HTTP " + std::to_string(status) + " for " + url);
    }

    PacedTransport::PacedTransport(Transport &inner, CourtesyGate &gate) : inner_(inner), gate_(gate) {}

    HttpResponse PacedTransport::request(const HttpRequest &request)
    {
        gate_.wait();
        return inner_.request(request);
    }

    RetryingTransport::RetryingTransport(Transport &inner, std::size_t max_retries,
                                         std::chrono::milliseconds initial_backoff, Logger &logger,
                                         CourtesyGate::Sleeper sleeper)
        : inner_(inner),
          max_retries_(max_retries),
          initial_backoff_(initial_backoff),
          logger_(logger),
          sleeper_(std::move(sleeper)) {}

    HttpResponse RetryingTransport::request(const HttpRequest &request)
    {
        auto backoff = initial_backoff_;
        for (std::size_t attempt = 0;; ++attempt)
        {
            try
            {
                return inner_.request(request);
            }
            catch (const TransportError &ex)
            {
                const bool transient = ex.status() == 0 || ex.status() >= 500;
                if (!transient || request.sink || attempt >= max_retries_)
                {
                    throw;
                }
                logger_.warn("transport", "Retrying ", to_string(request.method), " ", ex.url(), " after ",
                             ex.what(), " (attempt ", attempt + 2, " of ", max_retries_ + 1, ")");
                sleeper_(backoff);
                backoff *= 2;
            }
        }
    }

} // namespace coursesync::client
