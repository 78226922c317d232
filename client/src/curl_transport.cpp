#include "coursesync/client/curl_transport.hpp"

#include <cctype>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <curl/curl.h>

#include "coursesync/errors.hpp"

namespace coursesync::client
{

    namespace
    {

        void ensure_curl_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw std::runtime_error("curl_global_init failed");
                } });
        }

        struct TransferState
        {
            CURL *handle{nullptr};
            const HttpRequest *request{nullptr};
            HttpResponse response;
            std::exception_ptr sink_error;
        };

        std::string lower(std::string value)
        {
            for (auto &c : value)
            {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return value;
        }

        std::string trim(const std::string &value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        std::size_t on_header(char *data, std::size_t size, std::size_t count, void *user)
        {
            auto *state = static_cast<TransferState *>(user);
            const std::string line(data, size * count);
            if (line.rfind("HTTP/", 0) == 0)
            {
                // A redirect hop starts a new header block.
                state->response.headers.clear();
                return size * count;
            }
            const auto colon = line.find(':');
            if (colon != std::string::npos)
            {
                state->response.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
            }
            return size * count;
        }

        std::size_t on_body(char *data, std::size_t size, std::size_t count, void *user)
        {
            auto *state = static_cast<TransferState *>(user);
            const auto bytes = size * count;
            long status = 0;
            curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &status);

            if (!state->request->sink || status < 200 || status >= 300)
            {
                state->response.body.append(data, bytes);
                return bytes;
            }
            try
            {
                state->request->sink(std::string_view(data, bytes));
            }
            catch (...)
            {
                state->sink_error = std::current_exception();
                return 0;
            }
            return bytes;
        }

    } // namespace

    CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options))
    {
        ensure_curl_init();
    }

    HttpResponse CurlTransport::request(const HttpRequest &request)
    {
        const auto url = build_url(request.url, request.query);

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), &curl_easy_cleanup);
        if (!handle)
        {
            throw TransportError(0, url, "curl_easy_init failed");
        }

        const auto authorization = "Authorization: Bearer " + options_.token;
        curl_slist *raw_headers = curl_slist_append(nullptr, authorization.c_str());
        raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, &curl_slist_free_all);

        TransferState state;
        state.handle = handle.get();
        state.request = &request;

        char error_buffer[CURL_ERROR_SIZE] = {};
        CURL *h = handle.get();
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout.count()));
        curl_easy_setopt(h, CURLOPT_BUFFERSIZE, static_cast<long>(options_.chunk_size));
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &on_header);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &on_body);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
        if (request.method == HttpMethod::Head)
        {
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        }

        const CURLcode result = curl_easy_perform(h);
        if (state.sink_error)
        {
            std::rethrow_exception(state.sink_error);
        }
        if (result != CURLE_OK)
        {
            std::string message = curl_easy_strerror(result);
            if (error_buffer[0] != '\0')
            {
                message += ": ";
                message += error_buffer;
            }
            throw TransportError(0, url, message + " (" + url + ")");
        }

        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &state.response.status);
        throw_for_status(state.response.status, url);
        return std::move(state.response);
    }

} // namespace coursesync::client
