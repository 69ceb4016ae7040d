// =============================================================================
// packed-dna - Error Handling
// =============================================================================
// Error codes, exceptions and Result types shared by the packed-dna library
// and the pdna tool.
//
// Library code reports malformed input through Result (std::expected) and
// throws only for contract violations such as out-of-range access. The
// command layer turns both into process exit codes:
//
//   0 success         4 checksum mismatch
//   1 usage           5 invalid nucleotide symbol
//   2 I/O             6 index out of range
//   3 format          7 internal error
// =============================================================================

#ifndef PDNA_COMMON_ERROR_H
#define PDNA_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace pdna {

// =============================================================================
// Error Codes
// =============================================================================

/// @brief Error categories; the numeric value is the pdna exit code.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,

    /// @brief Bad arguments, or an output file that would be overwritten.
    kUsageError = 1,

    /// @brief Missing file, read or write failure.
    kIOError = 2,

    /// @brief Not a .pdna record: bad magic, version, sizes or padding.
    kFormatError = 3,

    kChecksumError = 4,

    /// @brief Input text holds a character outside AaCcGgTt.
    kInvalidSymbol = 5,

    /// @brief Index at or past the logical length of a sequence.
    kOutOfRange = 6,

    /// @brief Any failure not covered above (allocation failure, ...).
    kInternalError = 7
};

[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Short category name used as the what() prefix.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kInvalidSymbol:
            return "invalid symbol";
        case ErrorCode::kOutOfRange:
            return "out of range";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context
// =============================================================================

/// @brief Where an error happened: the file involved and/or a symbol index.
struct ErrorContext {
    std::string filePath;
    std::optional<std::uint64_t> position;

    /// @brief Render as "file: X, position: N"; empty when nothing is set.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base class of every exception thrown by packed-dna.
class PdnaException : public std::exception {
public:
    PdnaException(ErrorCode code, std::string message, ErrorContext context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    /// @brief "[category] message (context)".
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief The message without category or context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const ErrorContext& context() const noexcept { return context_; }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    ErrorContext context_;
    std::string what_;
};

class UsageError : public PdnaException {
public:
    explicit UsageError(std::string message, ErrorContext context = {})
        : PdnaException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

class IOError : public PdnaException {
public:
    explicit IOError(std::string message, ErrorContext context = {})
        : PdnaException(ErrorCode::kIOError, std::move(message), std::move(context)) {}
};

class FormatError : public PdnaException {
public:
    explicit FormatError(std::string message, ErrorContext context = {})
        : PdnaException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

class ChecksumError : public PdnaException {
public:
    explicit ChecksumError(std::string message, ErrorContext context = {})
        : PdnaException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}

    /// @brief "checksum mismatch: expected 0x..., got 0x..." (16 hex digits each).
    [[nodiscard]] static std::string formatChecksumMismatch(std::uint64_t expected,
                                                            std::uint64_t actual);
};

/// @brief Thrown when a ParseSymbolError is unwrapped.
class InvalidSymbolError : public PdnaException {
public:
    explicit InvalidSymbolError(std::string message, ErrorContext context = {})
        : PdnaException(ErrorCode::kInvalidSymbol, std::move(message), std::move(context)) {}
};

/// @brief Access at or past the end of a sequence.
/// @note A contract violation by the caller, never a malformed-input error.
class OutOfRangeError : public PdnaException {
public:
    explicit OutOfRangeError(std::string message)
        : PdnaException(ErrorCode::kOutOfRange, std::move(message)) {}

    OutOfRangeError(std::size_t index, std::size_t length)
        : PdnaException(ErrorCode::kOutOfRange, formatOutOfRange(index, length),
                        ErrorContext{.position = index}),
          index_(index),
          length_(length) {}

    /// @brief Offending index, when built from (index, length).
    [[nodiscard]] std::optional<std::size_t> index() const noexcept { return index_; }

    /// @brief Sequence length at the time of access, when built from (index, length).
    [[nodiscard]] std::optional<std::size_t> length() const noexcept { return length_; }

    [[nodiscard]] static std::string formatOutOfRange(std::size_t index, std::size_t length);

private:
    std::optional<std::size_t> index_;
    std::optional<std::size_t> length_;
};

// =============================================================================
// Result Type (std::expected)
// =============================================================================

/// @brief Error value carried by Result.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception class matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Result of an operation with no value on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Return the value or throw the exception matching the error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace pdna

#endif  // PDNA_COMMON_ERROR_H
