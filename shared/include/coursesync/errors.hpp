/**
 * coursesync - Exception hierarchy used across the sync pipeline.
 *
 * Every failure carries an ErrorCode so the front end can report it and pick an
 * exit status without inspecting message text.
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "coursesync/error_codes.hpp"

namespace coursesync
{

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Missing base URL or token. Raised before any request is made.
    class AuthConfigError : public Error
    {
    public:
        explicit AuthConfigError(std::string message);
    };

    class TransportError : public Error
    {
    public:
        TransportError(long status, std::string url, std::string message);

        long status() const noexcept { return status_; }
        const std::string &url() const noexcept { return url_; }
        bool access_denied() const noexcept { return status_ == 403; }

    protected:
        TransportError(ErrorCode code, long status, std::string url, std::string message);

    private:
        long status_;
        std::string url_;
    };

    class AccessDenied : public TransportError
    {
    public:
        explicit AccessDenied(std::string url);
    };

    // A page walk failed part way through; the whole collection is discarded.
    class PaginationError : public TransportError
    {
    public:
        PaginationError(long status, std::string url, std::size_t page, std::string message);

        std::size_t page() const noexcept { return page_; }

    private:
        std::size_t page_;
    };

    class ResolutionItemError : public Error
    {
    public:
        explicit ResolutionItemError(std::string message);
    };

    class SyncError : public Error
    {
    public:
        SyncError(ErrorCode code, std::string message);
    };

    class SelectionError : public Error
    {
    public:
        SelectionError(ErrorCode code, std::string message);
    };

} // namespace coursesync
