// =============================================================================
// packed-dna - Error Handling Implementation
// =============================================================================

#include "pdna/common/error.h"

#include <format>

namespace pdna {

std::string ErrorContext::format() const {
    std::string result;
    if (!filePath.empty()) {
        result = "file: " + filePath;
    }
    if (position.has_value()) {
        if (!result.empty()) {
            result += ", ";
        }
        result += std::format("position: {}", *position);
    }
    return result;
}

void PdnaException::formatWhat() {
    what_ = std::format("[{}] {}", errorCodeToString(code_), message_);
    if (const std::string where = context_.format(); !where.empty()) {
        what_ += " (" + where + ")";
    }
}

std::string ChecksumError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return std::format("checksum mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

std::string OutOfRangeError::formatOutOfRange(std::size_t index, std::size_t length) {
    return std::format("index {} out of range for sequence of length {}", index, length);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kInvalidSymbol:
            throw InvalidSymbolError(message_);
        case ErrorCode::kOutOfRange:
            throw OutOfRangeError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInternalError:
            break;
    }
    throw PdnaException(code_, message_);
}

}  // namespace pdna
