/**
 * coursesync - Authenticated request seam between the sync core and the network.
 *
 * Concrete transports throw TransportError for network failures (status 0) and
 * non-2xx responses, and AccessDenied for 403. Decorators add pacing and retry
 * without changing what callers observe on success or final failure.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "coursesync/client/courtesy_gate.hpp"
#include "coursesync/client/logger.hpp"

namespace coursesync::client
{

    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    enum class HttpMethod : std::uint8_t
    {
        Get,
        Head
    };

    std::string_view to_string(HttpMethod method) noexcept;

    struct HttpRequest
    {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        QueryParams query{};
        // When set the body is delivered here chunk by chunk instead of being buffered.
        std::function<void(std::string_view)> sink{};
    };

    struct HttpResponse
    {
        long status{};
        std::map<std::string, std::string> headers{}; // lower-case names
        std::string body{};

        std::optional<std::string> header(std::string_view name) const;
    };

    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual HttpResponse request(const HttpRequest &request) = 0;

        HttpResponse get(const std::string &url, const QueryParams &query = {});
    };

    std::string percent_encode(std::string_view value);

    // Appends query parameters (repeated keys allowed) to a URL that may already carry some.
    std::string build_url(const std::string &url, const QueryParams &query);

    // Throws AccessDenied / TransportError for a non-2xx status.
    void throw_for_status(long status, const std::string &url);

    // Waits on the shared courtesy gate before every request.
    class PacedTransport : public Transport
    {
    public:
        PacedTransport(Transport &inner, CourtesyGate &gate);

        HttpResponse request(const HttpRequest &request) override;

    private:
        Transport &inner_;
        CourtesyGate &gate_;
    };

    // Retries buffered requests that failed with 5xx or no response, doubling the
    // backoff each attempt. Streaming requests are never retried.
    class RetryingTransport : public Transport
    {
    public:
        RetryingTransport(Transport &inner, std::size_t max_retries, std::chrono::milliseconds initial_backoff,
                          Logger &logger, CourtesyGate::Sleeper sleeper = CourtesyGate::default_sleeper());

        HttpResponse request(const HttpRequest &request) override;

    private:
        Transport &inner_;
        std::size_t max_retries_;
        std::chrono::milliseconds initial_backoff_;
        Logger &logger_;
        CourtesyGate::Sleeper sleeper_;
    };

} // namespace coursesync::client
