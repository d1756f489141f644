#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace isobox {

//=============================================================================
// Error - message with an optional chained cause
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string fullMessage() const {
        std::string msg = _message;
        for (const Error* c = cause(); c; c = c->cause()) {
            msg += ": ";
            msg += c->message();
        }
        return msg;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

//=============================================================================
// Result<T> - value or Error
//=============================================================================
template<typename T>
class Result {
public:
    using ValueType = T;

    Result(T value) : _data(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    // Result<shared_ptr<Impl>> -> Result<shared_ptr<Interface>>
    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> &&
                                         std::is_convertible_v<U, T>>>
    Result(Result<U>&& other)
        : _data(other ? decltype(_data)(std::in_place_index<0>, std::move(*other))
                      : decltype(_data)(std::in_place_index<1>, other.error())) {}

    bool has_value() const { return _data.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    std::variant<T, Error> _data;
};

template<>
class Result<void> {
public:
    using ValueType = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const { return !_error.has_value(); }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//=============================================================================
// Constructors
//=============================================================================
inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().fullMessage();
}

} // namespace isobox
