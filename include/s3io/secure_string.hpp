#pragma once

#include <string>
#include <utility>

namespace s3io {

// String that zeros its memory when it is cleared, reassigned or destroyed.
// Holds credentials so they do not linger in freed heap blocks.
class SecureString {
public:
    SecureString() = default;

    explicit SecureString(const std::string& s) : data_(s) {}
    explicit SecureString(std::string&& s) : data_(std::move(s)) {}
    SecureString(const char* s) : data_(s ? s : "") {}

    SecureString(const SecureString& other) : data_(other.data_) {}

    SecureString(SecureString&& other) noexcept : data_(std::move(other.data_)) {
        other.wipe();
    }

    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            wipe();
            data_ = other.data_;
        }
        return *this;
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            wipe();
            data_ = std::move(other.data_);
            other.wipe();
        }
        return *this;
    }

    SecureString& operator=(const std::string& s) {
        wipe();
        data_ = s;
        return *this;
    }

    SecureString& operator=(const char* s) {
        wipe();
        data_ = s ? s : "";
        return *this;
    }

    ~SecureString() { wipe(); }

    const std::string& str() const { return data_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    bool operator==(const SecureString& other) const { return data_ == other.data_; }

    void clear() { wipe(); }

private:
    void wipe() {
        // volatile stores are not elided
        volatile char* p = data_.data();
        for (size_t i = 0; i < data_.size(); ++i) {
            p[i] = 0;
        }
        data_.clear();
        data_.shrink_to_fit();
    }

    std::string data_;
};

}  // namespace s3io
