#ifndef ASYNCFS_PENDING_OPERATION_H
#define ASYNCFS_PENDING_OPERATION_H

#include "asyncfs/result.h"
#include <atomic>
#include <functional>
#include <stdexcept>
#include <utility>

namespace asyncfs {

template <typename T>
using Callback = std::function<void(Result<T>)>;

// One dispatched non-blocking call. The callback runs exactly once; a
// second resolve is a logic error.
template <typename T>
class PendingOperation {
public:
    explicit PendingOperation(Callback<T> callback) : callback_(std::move(callback)) {
        if (!callback_) throw std::invalid_argument("non-blocking operation requires a completion callback");
    }

    PendingOperation(const PendingOperation&) = delete;
    PendingOperation& operator=(const PendingOperation&) = delete;

    void resolve(Result<T> result) {
        if (resolved_.exchange(true)) throw std::logic_error("operation resolved twice");
        Callback<T> cb = std::move(callback_);
        callback_ = nullptr;
        cb(std::move(result));
    }

    bool resolved() const { return resolved_.load(); }

private:
    Callback<T> callback_;
    std::atomic<bool> resolved_{false};
};

} // namespace asyncfs

#endif
