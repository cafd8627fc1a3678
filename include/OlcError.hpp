#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace olc {

enum class ErrorKind {
    None,
    InvalidLength,
    NotFullCode,
    NotValidShortCode,
    PaddedCode,
    InvalidCoordinate
};

const char* errorKindName(ErrorKind kind);

class OlcError : public std::invalid_argument {
public:
    OlcError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

template <typename T>
struct Result {
    std::optional<T> value;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return value.has_value(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorKind kind, std::string msg) {
        Result r;
        r.error = kind;
        r.message = std::move(msg);
        return r;
    }

    // Carries another result's error over to this value type.
    template <typename U>
    static Result failure(const Result<U>& other) {
        return failure(other.error, other.message);
    }

    T valueOrThrow() && {
        if (!value.has_value()) {
            throw OlcError(error, message);
        }
        return std::move(*value);
    }
};

}  // namespace olc
