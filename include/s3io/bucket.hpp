#pragma once

#include "s3io/object.hpp"
#include "s3io/transport.hpp"

#include <memory>
#include <string>

namespace s3io {

/// A named bucket on a store. Cheap to copy; copies share the transport.
class Bucket {
public:
    Bucket(std::string name, std::shared_ptr<Transport> transport)
        : name_(std::move(name))
        , transport_(std::move(transport)) {}

    const std::string& name() const { return name_; }

    /// Handle to the object with this key. No request is made.
    Object object(const std::string& key) const { return Object(name_, key, transport_); }

    const std::shared_ptr<Transport>& transport() const { return transport_; }

private:
    std::string name_;
    std::shared_ptr<Transport> transport_;
};

}  // namespace s3io
