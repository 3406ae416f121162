#pragma once

#include "s3io/transport.hpp"

#include <ios>
#include <memory>

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

namespace s3io {

/// Boost.Iostreams source over a fetched response body.
/// Copies share the same body.
class ByteStreamSource : public boost::iostreams::source {
public:
    explicit ByteStreamSource(ByteStream body);

    // Throws std::ios_base::failure if the transfer ended early
    std::streamsize read(char* s, std::streamsize n);

    size_t remaining() const { return body_->remaining(); }

private:
    std::shared_ptr<ByteStream> body_;
};

/// std::istream over a whole-object body, as returned by Object::reader().
class ByteStreamReader : public boost::iostreams::stream<ByteStreamSource> {
public:
    explicit ByteStreamReader(ByteStream body)
        : boost::iostreams::stream<ByteStreamSource>(ByteStreamSource(std::move(body))) {}
};

}  // namespace s3io
