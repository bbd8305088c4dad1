#ifndef LFS_NETWORK_REQUEST_ERROR_HPP
#define LFS_NETWORK_REQUEST_ERROR_HPP

#include <boost/beast/http/status.hpp>

namespace lfs {
namespace network {

enum class RequestError {
    MALFORMED_REQUEST,
    ROUTE_NOT_FOUND,
    OBJECT_NOT_FOUND,
    UNSUPPORTED_OPERATION
};

// Client-visible reason placed in the {"message": ...} envelope
inline const char* request_error_to_string(RequestError error) {
    switch (error) {
        case RequestError::MALFORMED_REQUEST: return "Wrong host";
        case RequestError::ROUTE_NOT_FOUND: return "Wrong path";
        case RequestError::OBJECT_NOT_FOUND: return "Object not found";
        case RequestError::UNSUPPORTED_OPERATION: return "Not implemented";
        default: return "Undefined error";
    }
}

inline boost::beast::http::status request_error_status(RequestError error) {
    switch (error) {
        case RequestError::MALFORMED_REQUEST: return boost::beast::http::status::bad_request;
        case RequestError::ROUTE_NOT_FOUND: return boost::beast::http::status::not_found;
        case RequestError::OBJECT_NOT_FOUND: return boost::beast::http::status::not_found;
        case RequestError::UNSUPPORTED_OPERATION: return boost::beast::http::status::not_implemented;
        default: return boost::beast::http::status::internal_server_error;
    }
}

} // namespace network
} // namespace lfs

#endif // LFS_NETWORK_REQUEST_ERROR_HPP
