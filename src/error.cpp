#include "s3io/error.hpp"

#include <sstream>

namespace s3io {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::ConstructionFailure: return "ConstructionFailure";
        case ErrorKind::DispatchFailure: return "DispatchFailure";
        case ErrorKind::ResponseError: return "ResponseError";
        case ErrorKind::NoSuchKey: return "NoSuchKey";
        case ErrorKind::InvalidObjectState: return "InvalidObjectState";
        case ErrorKind::NotModified: return "NotModified";
        case ErrorKind::Unhandled: return "Unhandled";
        case ErrorKind::Invariant: return "Invariant";
    }
    return "Unknown";
}

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::GetObject: return "GetObject";
        case Operation::HeadObject: return "HeadObject";
        case Operation::Internal: return "Internal";
    }
    return "Unknown";
}

bool ObjectError::is_transport() const {
    return kind == ErrorKind::Timeout ||
           kind == ErrorKind::ConstructionFailure ||
           kind == ErrorKind::DispatchFailure ||
           kind == ErrorKind::ResponseError;
}

bool ObjectError::is_service() const {
    return kind == ErrorKind::NoSuchKey ||
           kind == ErrorKind::InvalidObjectState ||
           kind == ErrorKind::NotModified ||
           kind == ErrorKind::Unhandled;
}

std::string ObjectError::to_string() const {
    std::ostringstream oss;
    oss << operation_name(operation) << ": " << error_kind_name(kind);
    if (http_status != 0) oss << " (HTTP " << http_status << ")";
    if (!service_code.empty()) oss << " [" << service_code << "]";
    if (!message.empty()) oss << ": " << message;
    if (!request_id.empty()) oss << " request_id=" << request_id;
    for (const auto& [k, v] : context) {
        oss << " " << k << "=" << v;
    }
    return oss.str();
}

ObjectError ObjectError::invariant(const std::string& message,
                                   const std::string& bucket_name,
                                   const std::string& key) {
    ObjectError err;
    err.kind = ErrorKind::Invariant;
    err.operation = Operation::Internal;
    err.message = message;
    err.context["bucket_name"] = bucket_name;
    err.context["key"] = key;
    return err;
}

const char* stream_error_kind_name(StreamErrorKind kind) {
    switch (kind) {
        case StreamErrorKind::TimedOut: return "TimedOut";
        case StreamErrorKind::Other: return "Other";
        case StreamErrorKind::InvalidData: return "InvalidData";
        case StreamErrorKind::NotFound: return "NotFound";
        case StreamErrorKind::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}

std::errc StreamError::errc() const {
    switch (kind) {
        case StreamErrorKind::TimedOut: return std::errc::timed_out;
        case StreamErrorKind::InvalidData: return std::errc::bad_message;
        case StreamErrorKind::NotFound: return std::errc::no_such_file_or_directory;
        case StreamErrorKind::InvalidInput: return std::errc::invalid_argument;
        case StreamErrorKind::Other: break;
    }
    return std::errc::io_error;
}

std::string StreamError::to_string() const {
    std::string result = stream_error_kind_name(kind);
    if (!message.empty()) {
        result += ": " + message;
    }
    if (cause) {
        result += " (" + cause->to_string() + ")";
    }
    return result;
}

StreamError to_stream_error(const ObjectError& error) {
    StreamError result;
    switch (error.kind) {
        case ErrorKind::Timeout:
            result.kind = StreamErrorKind::TimedOut;
            break;
        case ErrorKind::InvalidObjectState:
            result.kind = StreamErrorKind::InvalidData;
            break;
        case ErrorKind::NoSuchKey:
            result.kind = StreamErrorKind::NotFound;
            break;
        case ErrorKind::ConstructionFailure:
        case ErrorKind::DispatchFailure:
        case ErrorKind::ResponseError:
        case ErrorKind::Unhandled:
        case ErrorKind::Invariant:
        default:
            result.kind = StreamErrorKind::Other;
            break;
    }
    result.message = error.message.empty() ? error_kind_name(error.kind) : error.message;
    result.cause = error;
    return result;
}

}  // namespace s3io
