#pragma once

#include "s3io/byte_stream_reader.hpp"
#include "s3io/error.hpp"
#include "s3io/transport.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace s3io {

/// Reference point and offset for Object::seek().
struct SeekFrom {
    enum class Whence { Start, End, Current };

    Whence whence = Whence::Start;
    uint64_t start_offset = 0;   // used with Start
    int64_t relative_offset = 0; // used with End and Current

    static SeekFrom start(uint64_t offset) { return {Whence::Start, offset, 0}; }
    static SeekFrom end(int64_t offset) { return {Whence::End, 0, offset}; }
    static SeekFrom current(int64_t offset) { return {Whence::Current, 0, offset}; }
};

struct ReadResult {
    bool success = false;
    size_t bytes_read = 0;
    StreamError error;
};

struct SeekResult {
    bool success = false;
    uint64_t position = 0;
    StreamError error;
};

struct RefreshOutcome {
    bool success = false;
    bool modified = false;  // false when the service reported no change
    ObjectError error;
};

struct ReaderOutcome {
    bool success = false;
    std::unique_ptr<ByteStreamReader> reader;
    ObjectMetadata metadata;
    ObjectError error;
};

/// Handle to one object in a bucket, readable as a random-access byte stream.
///
/// read() and seek() are blocking; they resolve the object length with a
/// metadata request the first time it is needed and fetch byte ranges on
/// demand. Nothing of the content is cached. The cached length is only
/// replaced by refresh_metadata() when the service reports a change.
///
/// Not synchronized: a handle is used from one thread at a time. Handles are
/// cheap; make one per reader. Blocking calls must not be made from the
/// transport's own I/O threads (std::logic_error).
class Object {
public:
    Object(std::string bucket_name, std::string key, std::shared_ptr<Transport> transport);

    const std::string& bucket_name() const { return bucket_name_; }
    const std::string& key() const { return key_; }
    size_t position() const { return position_; }
    std::optional<size_t> length() const { return length_; }
    std::optional<std::chrono::system_clock::time_point> last_modified() const {
        return last_modified_;
    }

    /// Fetch the whole object.
    std::future<GetObjectOutcome> get() const;

    /// Fetch the whole object as an input stream.
    std::future<ReaderOutcome> reader() const;

    /// Fetch bytes [first, last], both inclusive. first > last fails with
    /// ConstructionFailure.
    std::future<GetObjectOutcome> get_range(uint64_t first, uint64_t last) const;

    /// Re-read length and last-modified time. Conditional on the cached
    /// last-modified time when there is one.
    ///
    /// The request is sent immediately; the handle's state is updated by
    /// the thread calling get() on the returned future, which must happen
    /// while the handle is alive.
    std::future<RefreshOutcome> refresh_metadata();

    /// Copy up to len bytes from the current position into buf.
    ReadResult read(uint8_t* buf, size_t len);
    ReadResult read(std::span<uint8_t> buf) { return read(buf.data(), buf.size()); }

    /// Move the cursor. Seeking past the end positions at the end.
    SeekResult seek(SeekFrom pos);

private:
    RefreshOutcome apply_metadata(HeadObjectOutcome outcome);

    // Make sure length_ is known; refreshes metadata if not
    std::optional<StreamError> ensure_length();

    // Block on a transport future; rejects calls from the I/O threads
    void check_blocking_allowed(const char* operation) const;

    SeekResult seek_start(uint64_t offset);

    std::string bucket_name_;
    std::string key_;
    size_t position_ = 0;
    std::optional<size_t> length_;
    std::optional<std::chrono::system_clock::time_point> last_modified_;
    std::shared_ptr<Transport> transport_;
};

}  // namespace s3io
