#pragma once

#include "s3io/constants.hpp"
#include "s3io/object.hpp"

#include <ios>

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

namespace s3io {

/// Seekable Boost.Iostreams device over an Object.
///
/// read() returns -1 at the end of the object. Failures from the object are
/// thrown as std::ios_base::failure carrying the stream error code, which
/// std::istream reports as badbit.
class ObjectDevice : public boost::iostreams::device<boost::iostreams::input_seekable> {
public:
    explicit ObjectDevice(Object object);

    std::streamsize read(char* s, std::streamsize n);
    std::streampos seek(std::streamoff off, std::ios_base::seekdir way);

    const Object& object() const { return object_; }

private:
    Object object_;
};

/// std::istream over an Object. Each buffer refill fetches one byte range
/// of buffer_size bytes.
class ObjectStream : public boost::iostreams::stream<ObjectDevice> {
public:
    explicit ObjectStream(Object object,
                          std::streamsize buffer_size = constants::DEFAULT_STREAM_BUFFER_SIZE)
        : boost::iostreams::stream<ObjectDevice>(ObjectDevice(std::move(object)), buffer_size) {}
};

}  // namespace s3io
