#ifndef ASYNCFS_RESULT_H
#define ASYNCFS_RESULT_H

#include "asyncfs/error.h"
#include <optional>
#include <utility>
#include <variant>

namespace asyncfs {

// Outcome of every blocking and non-blocking operation. Reading value()
// from a failed result throws FsException.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error err) : data_(std::in_place_index<1>, std::move(err)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() {
        if (!ok()) throw FsException(std::get<1>(data_));
        return std::get<0>(data_);
    }
    const T& value() const {
        if (!ok()) throw FsException(std::get<1>(data_));
        return std::get<0>(data_);
    }
    const Error& error() const { return std::get<1>(data_); }
    ErrorCode code() const { return std::get<1>(data_).code; }

private:
    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    Result() = default;
    Result(Error err) : error_(std::move(err)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    void value() const {
        if (error_) throw FsException(*error_);
    }
    const Error& error() const { return *error_; }
    ErrorCode code() const { return error_->code; }

private:
    std::optional<Error> error_;
};

} // namespace asyncfs

#endif
