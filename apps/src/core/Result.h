#pragma once

#include "Assert.h"
#include <optional>
#include <utility>
#include <variant>

namespace SweepLight {

/**
 * Value-or-error return type used across the core instead of exceptions.
 *
 * Example:
 *   Result<AttenuationGrid, LightingError> result = engine.calculate(grid, 2, 2);
 *   if (result.isError()) {
 *       LOG_WARN(Sweep, "{}", result.errorValue().message);
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value()
    {
        SWEEPLIGHT_ASSERT(isValue(), "Result::value() called on an error result");
        return std::get<0>(storage_);
    }

    const T& value() const
    {
        SWEEPLIGHT_ASSERT(isValue(), "Result::value() called on an error result");
        return std::get<0>(storage_);
    }

    E& errorValue()
    {
        SWEEPLIGHT_ASSERT(isError(), "Result::errorValue() called on a value result");
        return std::get<1>(storage_);
    }

    const E& errorValue() const
    {
        SWEEPLIGHT_ASSERT(isError(), "Result::errorValue() called on a value result");
        return std::get<1>(storage_);
    }

    // Moves the value out; the result must not be read again afterwards.
    T takeValue()
    {
        SWEEPLIGHT_ASSERT(isValue(), "Result::takeValue() called on an error result");
        return std::move(std::get<0>(storage_));
    }

private:
    template <size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : storage_(tag, std::forward<V>(v))
    {}

    std::variant<T, E> storage_;
};

} // namespace SweepLight
