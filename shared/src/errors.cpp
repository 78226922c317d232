#include "coursesync/errors.hpp"

#include <utility>

namespace coursesync
{

    Error::Error(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    AuthConfigError::AuthConfigError(std::string message)
        : Error(ErrorCode::MissingCredential, std::move(message)) {}

    TransportError::TransportError(long status, std::string url, std::string message)
        : TransportError(error_code_from_status(status), status, std::move(url), std::move(message)) {}

    TransportError::TransportError(ErrorCode code, long status, std::string url, std::string message)
        : Error(code, std::move(message)), status_(status), url_(std::move(url)) {}

    AccessDenied::AccessDenied(std::string url)
        : TransportError(ErrorCode::AccessDenied, 403, url, "HTTP 403 for " + url) {}

    PaginationError::PaginationError(long status, std::string url, std::size_t page, std::string message)
        : TransportError(status == 403 ? ErrorCode::AccessDenied : ErrorCode::PaginationFailed, status, std::move(url),
                         std::move(message)),
          page_(page) {}

    ResolutionItemError::ResolutionItemError(std::string message)
        : Error(ErrorCode::ItemUnresolved, std::move(message)) {}

    SyncError::SyncError(ErrorCode code, std::string message)
        : Error(code, std::move(message)) {}

    SelectionError::SelectionError(ErrorCode code, std::string message)
        : Error(code, std::move(message)) {}

} // namespace coursesync
