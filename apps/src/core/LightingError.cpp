#include "LightingError.h"

#include <utility>

namespace SweepLight {

LightingError LightingError::invalidDimensions(std::string message)
{
    return LightingError{ .code = Code::InvalidDimensions, .message = std::move(message) };
}

LightingError LightingError::outOfBounds(std::string message)
{
    return LightingError{ .code = Code::OutOfBounds, .message = std::move(message) };
}

const char* toString(LightingError::Code code)
{
    switch (code) {
        case LightingError::Code::InvalidDimensions:
            return "InvalidDimensions";
        case LightingError::Code::OutOfBounds:
            return "OutOfBounds";
    }
    return "Unknown";
}

} // namespace SweepLight
