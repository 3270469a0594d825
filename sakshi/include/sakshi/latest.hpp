#pragma once
// Latest: single-writer, multi-reader cell holding one immutable value
//
// store() swaps in a new value; load() hands out a shared reference to
// whatever was current. Readers never see a partially built value and
// keep their copy alive after it has been replaced. The lock covers the
// pointer swap only.

#include <memory>
#include <mutex>

namespace sakshi {

template <typename T>
class Latest {
public:
    using Ptr = std::shared_ptr<const T>;

    Latest() = default;
    Latest(const Latest&) = delete;
    Latest& operator=(const Latest&) = delete;

    void store(Ptr value) {
        Ptr previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = std::move(value_);
            value_ = std::move(value);
        }
        // previous is released outside the lock
    }

    Ptr load() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    void clear() { store(nullptr); }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_ == nullptr;
    }

private:
    mutable std::mutex mutex_;
    Ptr value_;
};

} // namespace sakshi
