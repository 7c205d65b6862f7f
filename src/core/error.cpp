#include <colmat/core/error.hpp>

#include <fmt/format.h>

namespace colmat {

auto error_code_name(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::MissingNativeProducer:
            return "MissingNativeProducer";
        case ErrorCode::UnsupportedOperation:
            return "UnsupportedOperation";
        case ErrorCode::IllegalConversion:
            return "IllegalConversion";
        case ErrorCode::ConversionError:
            return "ConversionError";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(fmt::format("{}: {}", error_code_name(code), message)), code_(code) {}

}  // namespace colmat
