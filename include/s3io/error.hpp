#pragma once

#include <map>
#include <optional>
#include <string>
#include <system_error>

namespace s3io {

// Kinds of failure reported by object operations.
// New kinds may be added; code switching on ErrorKind needs a default arm.
enum class ErrorKind {
    // Transport level
    Timeout,              // Request did not complete within the client's timeout
    ConstructionFailure,  // Request could not be built (bad URL, bad range)
    DispatchFailure,      // Request could not be sent (DNS, connect, TLS)
    ResponseError,        // Response was malformed or cut short

    // Service level
    NoSuchKey,
    InvalidObjectState,   // e.g. archived object that must be restored first
    NotModified,          // Conditional request matched the cached timestamp
    Unhandled,            // Any other service error code

    // Internal invariant violated (value out of representable range)
    Invariant
};

// Which remote operation produced an error.
enum class Operation {
    GetObject,
    HeadObject,
    Internal
};

const char* error_kind_name(ErrorKind kind);
const char* operation_name(Operation op);

/// Error from get(), get_range() or refresh_metadata().
struct ObjectError {
    ErrorKind kind = ErrorKind::Unhandled;
    Operation operation = Operation::Internal;
    std::string message;

    int http_status = 0;           // 0 when no response was received
    std::string service_code;      // <Code> from the S3 error body
    std::string request_id;

    // Structured diagnostic context (bucket_name, key, ...)
    std::map<std::string, std::string> context;

    bool is_transport() const;
    bool is_service() const;

    std::string to_string() const;

    /// Build an Invariant error carrying the object identity.
    static ObjectError invariant(const std::string& message,
                                 const std::string& bucket_name,
                                 const std::string& key);
};

// Error kinds of the synchronous stream contract (read / seek).
enum class StreamErrorKind {
    TimedOut,
    Other,
    InvalidData,
    NotFound,
    InvalidInput
};

const char* stream_error_kind_name(StreamErrorKind kind);

/// Error from Object::read() / Object::seek().
struct StreamError {
    StreamErrorKind kind = StreamErrorKind::Other;
    std::string message;
    std::optional<ObjectError> cause;

    /// Portable equivalent (timed_out, io_error, bad_message, ...).
    std::errc errc() const;
    std::error_code error_code() const { return std::make_error_code(errc()); }

    std::string to_string() const;
};

/// Map an object error onto the stream taxonomy.
///   Timeout            -> TimedOut
///   Construction/Dispatch/Response failure -> Other
///   InvalidObjectState -> InvalidData
///   NoSuchKey          -> NotFound
///   Unhandled, Invariant and anything else -> Other
StreamError to_stream_error(const ObjectError& error);

}  // namespace s3io
