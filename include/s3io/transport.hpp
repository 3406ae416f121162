#pragma once

#include "s3io/error.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <ios>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace s3io {

// Metadata about a stored object, as reported by the service
struct ObjectMetadata {
    int64_t content_length = 0;  // Signed as reported; validated by the consumer
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::string etag;
    std::string content_type;
    std::string storage_class;
};

/// Response body of a GET.
///
/// Holds the received chunks in arrival order and hands them out either
/// incrementally (read_some) or all at once (collect). A transfer that ended
/// early carries an error that is reported once the received bytes run out.
class ByteStream {
public:
    ByteStream() = default;
    explicit ByteStream(std::vector<uint8_t> data);
    ByteStream(std::vector<std::vector<uint8_t>> chunks,
               std::optional<ObjectError> trailing_error);

    ByteStream(ByteStream&&) noexcept = default;
    ByteStream& operator=(ByteStream&&) noexcept = default;
    ByteStream(const ByteStream&) = delete;
    ByteStream& operator=(const ByteStream&) = delete;

    struct CollectResult {
        bool success = false;
        std::vector<uint8_t> bytes;
        ObjectError error;
    };

    /// Drain everything not yet read.
    CollectResult collect();

    /// Copy up to n bytes into s. Returns -1 once the body is exhausted.
    /// Throws std::ios_base::failure if the transfer ended early.
    std::streamsize read_some(char* s, std::streamsize n);

    /// Bytes still available.
    size_t remaining() const { return total_ - consumed_; }

    bool truncated() const { return trailing_error_.has_value(); }

private:
    std::vector<std::vector<uint8_t>> chunks_;
    std::optional<ObjectError> trailing_error_;
    size_t chunk_index_ = 0;
    size_t chunk_offset_ = 0;
    size_t total_ = 0;
    size_t consumed_ = 0;
};

struct GetObjectRequest {
    std::string bucket;
    std::string key;
    // Inclusive byte range (first, last); whole object when unset
    std::optional<std::pair<uint64_t, uint64_t>> range;
};

struct HeadObjectRequest {
    std::string bucket;
    std::string key;
    // When set, the service may answer NotModified instead of metadata
    std::optional<std::chrono::system_clock::time_point> if_modified_since;
};

struct GetObjectOutcome {
    bool success = false;
    ByteStream body;
    ObjectMetadata metadata;
    ObjectError error;
};

struct HeadObjectOutcome {
    bool success = false;
    ObjectMetadata metadata;
    ObjectError error;  // kind == NotModified for an unchanged conditional request
};

/// Asynchronous client for a remote object service.
///
/// Implementations own their network resources and I/O threads. A Transport
/// is shared through std::shared_ptr so that stores, buckets and objects all
/// reuse one connection pool.
class Transport {
public:
    virtual ~Transport() = default;

    // Get the transport type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Fetch an object, or a byte range of it
    virtual std::future<GetObjectOutcome> get_object(const GetObjectRequest& request) const = 0;

    // Fetch object metadata without the body
    virtual std::future<HeadObjectOutcome> head_object(const HeadObjectRequest& request) const = 0;

    // True when the calling thread is one of this transport's I/O threads.
    // Blocking on a transport future from such a thread can deadlock.
    virtual bool on_io_thread() const = 0;
};

}  // namespace s3io
