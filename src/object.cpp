#include "s3io/object.hpp"
#include "s3io/log.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace s3io {

namespace {

template<typename T>
std::future<T> ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

// |offset| for a negative offset, INT64_MIN included
uint64_t negative_magnitude(int64_t offset) {
    return static_cast<uint64_t>(-(offset + 1)) + 1;
}

StreamError make_stream_error(StreamErrorKind kind, const std::string& message) {
    StreamError err;
    err.kind = kind;
    err.message = message;
    return err;
}

SeekResult seek_failure(StreamError error) {
    SeekResult result;
    result.error = std::move(error);
    return result;
}

ReadResult read_failure(StreamError error) {
    ReadResult result;
    result.error = std::move(error);
    return result;
}

}  // namespace

Object::Object(std::string bucket_name, std::string key, std::shared_ptr<Transport> transport)
    : bucket_name_(std::move(bucket_name))
    , key_(std::move(key))
    , transport_(std::move(transport)) {}

std::future<GetObjectOutcome> Object::get() const {
    GetObjectRequest request;
    request.bucket = bucket_name_;
    request.key = key_;
    return transport_->get_object(request);
}

std::future<ReaderOutcome> Object::reader() const {
    auto pending = get();
    return std::async(std::launch::deferred, [pending = std::move(pending)]() mutable {
        auto outcome = pending.get();
        ReaderOutcome result;
        if (!outcome.success) {
            result.error = std::move(outcome.error);
            return result;
        }
        result.metadata = std::move(outcome.metadata);
        result.reader = std::make_unique<ByteStreamReader>(std::move(outcome.body));
        result.success = true;
        return result;
    });
}

std::future<GetObjectOutcome> Object::get_range(uint64_t first, uint64_t last) const {
    if (first > last) {
        GetObjectOutcome outcome;
        outcome.error.kind = ErrorKind::ConstructionFailure;
        outcome.error.operation = Operation::GetObject;
        outcome.error.message = "invalid byte range " + std::to_string(first) + "-" +
                                std::to_string(last);
        outcome.error.context["bucket_name"] = bucket_name_;
        outcome.error.context["key"] = key_;
        return ready_future(std::move(outcome));
    }

    GetObjectRequest request;
    request.bucket = bucket_name_;
    request.key = key_;
    request.range = std::make_pair(first, last);
    return transport_->get_object(request);
}

std::future<RefreshOutcome> Object::refresh_metadata() {
    HeadObjectRequest request;
    request.bucket = bucket_name_;
    request.key = key_;
    request.if_modified_since = last_modified_;

    auto pending = transport_->head_object(request);
    return std::async(std::launch::deferred, [this, pending = std::move(pending)]() mutable {
        return apply_metadata(pending.get());
    });
}

RefreshOutcome Object::apply_metadata(HeadObjectOutcome outcome) {
    RefreshOutcome result;

    if (!outcome.success) {
        if (outcome.error.kind == ErrorKind::NotModified) {
            result.success = true;
            result.modified = false;
            return result;
        }
        result.error = std::move(outcome.error);
        return result;
    }

    int64_t content_length = outcome.metadata.content_length;
    if (content_length < 0 ||
        static_cast<uint64_t>(content_length) > std::numeric_limits<size_t>::max()) {
        result.error = ObjectError::invariant(
            "content length " + std::to_string(content_length) + " is out of range",
            bucket_name_, key_);
        return result;
    }

    length_ = static_cast<size_t>(content_length);
    last_modified_ = outcome.metadata.last_modified;

    log_debug("s3://%s/%s: length=%zu", bucket_name_.c_str(), key_.c_str(), *length_);

    result.success = true;
    result.modified = true;
    return result;
}

void Object::check_blocking_allowed(const char* operation) const {
    if (transport_->on_io_thread()) {
        throw std::logic_error(std::string("Object::") + operation +
                               " called from a transport I/O thread; it would block the "
                               "thread that must complete it");
    }
}

std::optional<StreamError> Object::ensure_length() {
    if (length_) return std::nullopt;

    check_blocking_allowed("refresh_metadata");
    auto outcome = refresh_metadata().get();
    if (!outcome.success) {
        StreamError err = make_stream_error(StreamErrorKind::Other,
                                            "failed to fetch object metadata");
        err.cause = std::move(outcome.error);
        return err;
    }
    if (!length_) {
        return make_stream_error(StreamErrorKind::Other, "object length unavailable");
    }
    return std::nullopt;
}

ReadResult Object::read(uint8_t* buf, size_t len) {
    if (auto err = ensure_length()) {
        return read_failure(std::move(*err));
    }

    ReadResult result;
    size_t length = *length_;
    if (position_ >= length || len == 0) {
        result.success = true;
        return result;
    }

    uint64_t first = position_;
    if (static_cast<uint64_t>(len - 1) > std::numeric_limits<uint64_t>::max() - first) {
        return read_failure(make_stream_error(StreamErrorKind::Other,
                                              "read range end overflows"));
    }
    uint64_t last = first + (len - 1);

    check_blocking_allowed("read");
    auto outcome = get_range(first, last).get();
    if (!outcome.success) {
        if (outcome.error.kind == ErrorKind::Invariant) {
            throw std::logic_error("unexpected invariant error from range fetch: " +
                                   outcome.error.to_string());
        }
        return read_failure(to_stream_error(outcome.error));
    }

    auto collected = outcome.body.collect();
    if (!collected.success) {
        if (collected.error.kind == ErrorKind::Invariant) {
            throw std::logic_error("unexpected invariant error from range body: " +
                                   collected.error.to_string());
        }
        return read_failure(to_stream_error(collected.error));
    }

    size_t n = std::min({collected.bytes.size(), len, length - position_});
    if (n > 0) {
        std::memcpy(buf, collected.bytes.data(), n);
    }
    position_ += n;

    result.success = true;
    result.bytes_read = n;
    return result;
}

SeekResult Object::seek_start(uint64_t offset) {
    size_t length = *length_;
    position_ = offset > length ? length : static_cast<size_t>(offset);

    SeekResult result;
    result.success = true;
    result.position = position_;
    return result;
}

SeekResult Object::seek(SeekFrom pos) {
    if (auto err = ensure_length()) {
        return seek_failure(std::move(*err));
    }
    size_t length = *length_;

    switch (pos.whence) {
        case SeekFrom::Whence::Start:
            return seek_start(pos.start_offset);

        case SeekFrom::Whence::End: {
            if (pos.relative_offset >= 0) {
                return seek_start(length);
            }
            uint64_t back = negative_magnitude(pos.relative_offset);
            if (back > length) {
                return seek_failure(make_stream_error(StreamErrorKind::InvalidInput,
                                                      "tried to seek to a negative offset"));
            }
            return seek_start(length - back);
        }

        case SeekFrom::Whence::Current: {
            if (pos.relative_offset >= 0) {
                uint64_t forward = static_cast<uint64_t>(pos.relative_offset);
                if (forward > std::numeric_limits<uint64_t>::max() - position_) {
                    return seek_failure(make_stream_error(StreamErrorKind::Other,
                                                          "seek position overflows"));
                }
                return seek_start(position_ + forward);
            }
            uint64_t back = negative_magnitude(pos.relative_offset);
            if (back > position_) {
                return seek_failure(make_stream_error(StreamErrorKind::InvalidInput,
                                                      "tried to seek to a negative offset"));
            }
            return seek_start(position_ - back);
        }
    }

    return seek_failure(make_stream_error(StreamErrorKind::InvalidInput, "invalid seek origin"));
}

}  // namespace s3io
