#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "coursesync/client/transport.hpp"

namespace coursesync::client
{

    struct CurlTransportOptions
    {
        std::string token;
        std::string user_agent{"coursesync"};
        std::chrono::seconds connect_timeout{30};
        // Abort a transfer that stays below 1 byte/s for this long.
        std::chrono::seconds stall_timeout{120};
        std::size_t chunk_size{4096};
    };

    // libcurl backed transport. Every request uses its own easy handle, so one
    // instance may be shared by several workers.
    class CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(CurlTransportOptions options);

        HttpResponse request(const HttpRequest &request) override;

    private:
        CurlTransportOptions options_;
    };

} // namespace coursesync::client
