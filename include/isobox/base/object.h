#pragma once

#include <isobox/result.hpp>
#include <atomic>
#include <cstdint>
#include <memory>

namespace isobox {
namespace base {

using ObjectId = uint64_t;

class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    ObjectId id() const { return _id; }

    virtual const char* typeName() const { return "Object"; }

    // Prevent copying/moving - use shared_ptr
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

protected:
    Object() : _id(nextId()) {}

private:
    static ObjectId nextId() {
        static std::atomic<ObjectId> _counter{1};
        return _counter++;
    }

    ObjectId _id;
};

} // namespace base
} // namespace isobox
