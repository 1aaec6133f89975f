#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tessera {

/// Error taxonomy shared by every layer.
enum class ErrorKind : std::uint8_t {
    UnrecognizedNativeType,
    UnsupportedOperation,
    DtypeMismatch,
    UnknownDtype,
    ColumnNotFound,
    InvalidOperation,
    /// Evaluation failure inside a wrapped engine, carried unchanged.
    Native,
    Configuration,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Structured error value returned through std::expected.
///
/// `backend` names the adapter that produced the error, empty when the error
/// was raised by backend-independent code (IR expansion, dtype inference).
struct Error {
    ErrorKind kind = ErrorKind::InvalidOperation;
    std::string message;
    std::string backend;

    /// "UnsupportedOperation[arrow]: window function 'rank' ..."
    [[nodiscard]] auto describe() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message, std::string backend = {})
    -> std::unexpected<Error>;

[[nodiscard]] auto unsupported(std::string_view what, std::string_view backend)
    -> std::unexpected<Error>;

/// Exception thrown by the facade layer.
class Exception : public std::runtime_error {
   public:
    explicit Exception(Error error);

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return error_.kind; }
    [[nodiscard]] auto backend() const noexcept -> const std::string& { return error_.backend; }
    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }

   private:
    Error error_;
};

/// Unwrap a Result or throw tessera::Exception.
template <typename T>
auto value_or_throw(Result<T> result) -> T {
    if (!result) {
        throw Exception(std::move(result.error()));
    }
    return std::move(*result);
}

}  // namespace tessera
