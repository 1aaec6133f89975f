#include <tessera/core/error.hpp>

#include <fmt/format.h>

namespace tessera {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::UnrecognizedNativeType:
            return "UnrecognizedNativeType";
        case ErrorKind::UnsupportedOperation:
            return "UnsupportedOperation";
        case ErrorKind::DtypeMismatch:
            return "DtypeMismatch";
        case ErrorKind::UnknownDtype:
            return "UnknownDtype";
        case ErrorKind::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorKind::InvalidOperation:
            return "InvalidOperation";
        case ErrorKind::Native:
            return "NativeError";
        case ErrorKind::Configuration:
            return "ConfigurationError";
    }
    return "Error";
}

auto Error::describe() const -> std::string {
    if (backend.empty()) {
        return fmt::format("{}: {}", to_string(kind), message);
    }
    return fmt::format("{}[{}]: {}", to_string(kind), backend, message);
}

auto make_error(ErrorKind kind, std::string message, std::string backend)
    -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = kind, .message = std::move(message), .backend = std::move(backend)});
}

auto unsupported(std::string_view what, std::string_view backend) -> std::unexpected<Error> {
    return make_error(ErrorKind::UnsupportedOperation,
                      fmt::format("{} is not supported by the '{}' backend", what, backend),
                      std::string(backend));
}

Exception::Exception(Error error) : std::runtime_error(error.describe()), error_(std::move(error)) {}

}  // namespace tessera
