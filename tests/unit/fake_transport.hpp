#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "coursesync/client/transport.hpp"
#include "coursesync/errors.hpp"

namespace coursesync::testing
{

    struct FakeReply
    {
        long status{200};
        std::string body{};
        std::map<std::string, std::string> headers{};
    };

    // Scripted transport. A reply registered for the full URL (query included)
    // wins over one registered for the bare path; anything else is a 404.
    class FakeTransport : public client::Transport
    {
    public:
        void on(const std::string &url, FakeReply reply)
        {
            std::lock_guard lock(mutex_);
            exact_[url] = std::move(reply);
        }

        void on_path(const std::string &path, FakeReply reply)
        {
            std::lock_guard lock(mutex_);
            by_path_[path] = std::move(reply);
        }

        client::HttpResponse request(const client::HttpRequest &request) override
        {
            const auto url = client::build_url(request.url, request.query);
            FakeReply reply;
            {
                std::lock_guard lock(mutex_);
                calls_.push_back(url);
                if (const auto it = exact_.find(url); it != exact_.end())
                {
                    reply = it->second;
                }
                else if (const auto path = by_path_.find(url.substr(0, url.find('?'))); path != by_path_.end())
                {
                    reply = path->second;
                }
                else
                {
                    reply.status = 404;
                }
            }

            if (reply.status == 0)
            {
                throw TransportError(0, url, "connection refused");
            }
            if (reply.status < 200 || reply.status >= 300)
            {
                client::throw_for_status(reply.status, url);
            }

            client::HttpResponse response{.status = reply.status, .headers = reply.headers, .body = {}};
            if (request.sink)
            {
                for (std::size_t offset = 0; offset < reply.body.size(); offset += 4)
                {
                    request.sink(std::string_view(reply.body).substr(offset, 4));
                }
            }
            else
            {
                response.body = reply.body;
            }
            return response;
        }

        std::vector<std::string> calls() const
        {
            std::lock_guard lock(mutex_);
            return calls_;
        }

        std::size_t call_count() const
        {
            std::lock_guard lock(mutex_);
            return calls_.size();
        }

        std::size_t calls_to(const std::string &path) const
        {
            std::lock_guard lock(mutex_);
            std::size_t count = 0;
            for (const auto &call : calls_)
            {
                if (call.substr(0, call.find('?')) == path)
                {
                    ++count;
                }
            }
            return count;
        }

        void reset_calls()
        {
            std::lock_guard lock(mutex_);
            calls_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, FakeReply> exact_;
        std::map<std::string, FakeReply> by_path_;
        std::vector<std::string> calls_;
    };

} // namespace coursesync::testing
