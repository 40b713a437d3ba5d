#pragma once

#include <string>

namespace SweepLight {

/**
 * Error returned by the core's fallible operations.
 *
 * Only shape and bounds problems are errors; out-of-range decay, color and intensity values are
 * clamped where they are consumed.
 */
struct LightingError {
    enum class Code {
        InvalidDimensions, // Zero size, or a buffer whose length/shape does not match.
        OutOfBounds,       // Light source outside the grid.
    };

    Code code = Code::InvalidDimensions;
    std::string message;

    static LightingError invalidDimensions(std::string message);
    static LightingError outOfBounds(std::string message);
};

const char* toString(LightingError::Code code);

} // namespace SweepLight
