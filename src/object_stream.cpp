#include "s3io/byte_stream_reader.hpp"
#include "s3io/object_stream.hpp"

namespace s3io {

namespace {

[[noreturn]] void throw_stream_error(const StreamError& error) {
    throw std::ios_base::failure(error.to_string(), error.error_code());
}

SeekFrom to_seek_from(std::streamoff off, std::ios_base::seekdir way) {
    switch (way) {
        case std::ios_base::beg:
            if (off < 0) {
                StreamError err;
                err.kind = StreamErrorKind::InvalidInput;
                err.message = "tried to seek to a negative offset";
                throw_stream_error(err);
            }
            return SeekFrom::start(static_cast<uint64_t>(off));
        case std::ios_base::cur:
            return SeekFrom::current(static_cast<int64_t>(off));
        case std::ios_base::end:
            return SeekFrom::end(static_cast<int64_t>(off));
        default:
            throw std::ios_base::failure("invalid seekdir",
                                         std::make_error_code(std::errc::invalid_argument));
    }
}

}  // namespace

// ============================================================================
// ByteStreamSource
// ============================================================================

ByteStreamSource::ByteStreamSource(ByteStream body)
    : body_(std::make_shared<ByteStream>(std::move(body))) {}

std::streamsize ByteStreamSource::read(char* s, std::streamsize n) {
    return body_->read_some(s, n);
}

// ============================================================================
// ObjectDevice
// ============================================================================

ObjectDevice::ObjectDevice(Object object)
    : object_(std::move(object)) {}

std::streamsize ObjectDevice::read(char* s, std::streamsize n) {
    if (n <= 0) return 0;

    auto result = object_.read(reinterpret_cast<uint8_t*>(s), static_cast<size_t>(n));
    if (!result.success) {
        throw_stream_error(result.error);
    }
    if (result.bytes_read == 0) {
        return -1;  // EOF
    }
    return static_cast<std::streamsize>(result.bytes_read);
}

std::streampos ObjectDevice::seek(std::streamoff off, std::ios_base::seekdir way) {
    auto result = object_.seek(to_seek_from(off, way));
    if (!result.success) {
        throw_stream_error(result.error);
    }
    return std::streampos(static_cast<std::streamoff>(result.position));
}

}  // namespace s3io
