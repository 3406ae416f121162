#include "s3io/transport.hpp"

#include <algorithm>
#include <cstring>
#include <system_error>

namespace s3io {

ByteStream::ByteStream(std::vector<uint8_t> data)
    : total_(data.size()) {
    if (!data.empty()) {
        chunks_.push_back(std::move(data));
    }
}

ByteStream::ByteStream(std::vector<std::vector<uint8_t>> chunks,
                       std::optional<ObjectError> trailing_error)
    : chunks_(std::move(chunks))
    , trailing_error_(std::move(trailing_error)) {
    for (const auto& chunk : chunks_) {
        total_ += chunk.size();
    }
}

ByteStream::CollectResult ByteStream::collect() {
    CollectResult result;
    if (trailing_error_) {
        result.error = *trailing_error_;
        return result;
    }

    result.bytes.reserve(remaining());
    while (chunk_index_ < chunks_.size()) {
        const auto& chunk = chunks_[chunk_index_];
        result.bytes.insert(result.bytes.end(),
                            chunk.begin() + static_cast<std::ptrdiff_t>(chunk_offset_),
                            chunk.end());
        ++chunk_index_;
        chunk_offset_ = 0;
    }
    consumed_ = total_;
    result.success = true;
    return result;
}

std::streamsize ByteStream::read_some(char* s, std::streamsize n) {
    if (n <= 0) return 0;

    size_t wanted = static_cast<size_t>(n);
    size_t copied = 0;
    while (copied < wanted && chunk_index_ < chunks_.size()) {
        const auto& chunk = chunks_[chunk_index_];
        size_t available = chunk.size() - chunk_offset_;
        size_t to_copy = std::min(available, wanted - copied);
        std::memcpy(s + copied, chunk.data() + chunk_offset_, to_copy);
        copied += to_copy;
        chunk_offset_ += to_copy;
        if (chunk_offset_ == chunk.size()) {
            ++chunk_index_;
            chunk_offset_ = 0;
        }
    }
    consumed_ += copied;

    if (copied > 0) {
        return static_cast<std::streamsize>(copied);
    }
    if (trailing_error_) {
        throw std::ios_base::failure(trailing_error_->to_string(),
                                     std::make_error_code(std::errc::io_error));
    }
    return -1;
}

}  // namespace s3io
