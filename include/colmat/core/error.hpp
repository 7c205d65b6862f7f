#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace colmat {

/// Failure categories raised by the materialization layer.
///
/// None of these are recoverable inside colmat: they describe a planning or
/// data defect and propagate up to abort the surrounding query stage.
enum class ErrorCode : std::uint8_t {
    /// A transform was defined without a way to produce its own native type.
    MissingNativeProducer,
    /// A dictionary-only operation was called on a non-dictionary transform.
    UnsupportedOperation,
    /// The requested type has no derivation path from the native type.
    IllegalConversion,
    /// A single value could not be converted (e.g. unparsable text).
    ConversionError,
};

[[nodiscard]] auto error_code_name(ErrorCode code) noexcept -> std::string_view;

class Error : public std::runtime_error {
   public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }

   private:
    ErrorCode code_;
};

}  // namespace colmat
