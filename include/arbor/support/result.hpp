//===----------------------------------------------------------------------===//
//
// Part of the Arbor project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/arbor/support/result.hpp
// Purpose: Provides a simple Result type for lookups that may fail.
// Key invariants: Exactly one of value or error message is present.
// Ownership/Lifetime: Result owns contained value or error.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace arbor::support
{

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

/// @brief Sentinel instance for success construction convenience.
inline constexpr SuccessTag kSuccessTag{};

/// @brief Minimal expected-like container.
/// @invariant Either holds a value or an error string.
template <typename T> class Result
{
  public:
    /// @brief Creates a successful result containing a value.
    template <typename U = T> Result(SuccessTag /*tag*/, U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Creates a successful result from a value without an explicit tag.
    template <typename U = T> Result(U &&value) : Result(kSuccessTag, std::forward<U>(value)) {}

    /// @brief Factory that constructs an error result with a message.
    /// @param error Error description to store.
    static Result error(std::string error)
    {
        return Result(ErrorTag{}, std::move(error));
    }

    /// @brief Indicates whether the Result currently holds a value.
    bool isOk() const
    {
        return value_.has_value();
    }

    /// @pre @c isOk() must return true.
    T &value()
    {
        return *value_;
    }

    /// @pre @c isOk() must return true.
    const T &value() const
    {
        return *value_;
    }

    /// @pre @c isOk() must return false.
    const std::string &error() const
    {
        return error_;
    }

  private:
    struct ErrorTag
    {
        constexpr ErrorTag() = default;
    };

    Result(ErrorTag /*tag*/, std::string error) : error_(std::move(error)) {}

    std::optional<T> value_;
    std::string error_;
};

} // namespace arbor::support
