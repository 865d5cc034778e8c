#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace wb
{

enum class ErrorKind
{
    InvalidArgument,
    HostError,
    CreationError,
    HandlerError,
    ProtocolError,
};

char const *to_string(ErrorKind kind) noexcept;

struct Error
{
    ErrorKind kind = ErrorKind::HostError;
    std::string message;
};

// Thrown synchronously when a geometry tag is neither Logical nor Physical.
// Nothing has been sent to the host when this escapes.
class InvalidArgument : public std::invalid_argument
{
  public:
    explicit InvalidArgument(std::string const &message)
        : std::invalid_argument(message)
    {
    }
};

template <typename T> class Result
{
  public:
    static Result success(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(Error error)
    {
        return Result(std::in_place_index<1>, std::move(error));
    }

    static Result failure(ErrorKind kind, std::string message)
    {
        return failure(Error{kind, std::move(message)});
    }

    bool ok() const noexcept
    {
        return state_.index() == 0;
    }

    explicit operator bool() const noexcept
    {
        return ok();
    }

    T const &value() const
    {
        if (!ok())
        {
            throw std::logic_error("Result holds an error: " +
                                   std::get<1>(state_).message);
        }
        return std::get<0>(state_);
    }

    T &value()
    {
        if (!ok())
        {
            throw std::logic_error("Result holds an error: " +
                                   std::get<1>(state_).message);
        }
        return std::get<0>(state_);
    }

    Error const &error() const
    {
        if (ok())
        {
            throw std::logic_error("Result holds a value");
        }
        return std::get<1>(state_);
    }

  private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V &&value)
        : state_(tag, std::forward<V>(value))
    {
    }

    std::variant<T, Error> state_;
};

template <> class Result<void>
{
  public:
    static Result success()
    {
        return Result();
    }

    static Result failure(Error error)
    {
        Result result;
        result.error_ = std::move(error);
        return result;
    }

    static Result failure(ErrorKind kind, std::string message)
    {
        return failure(Error{kind, std::move(message)});
    }

    bool ok() const noexcept
    {
        return !error_.has_value();
    }

    explicit operator bool() const noexcept
    {
        return ok();
    }

    Error const &error() const
    {
        if (!error_)
        {
            throw std::logic_error("Result holds no error");
        }
        return *error_;
    }

  private:
    std::optional<Error> error_;
};

// Every asynchronous operation completes through exactly one call.
template <typename T> using Callback = std::function<void(Result<T>)>;

} // namespace wb
