//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/support/expected.hpp
// Purpose: Provides the error record and a lightweight Expected container used
//          by every fallible tbox operation.
// Key invariants: An Expected holds exactly one of a value or an Error.
// Ownership/Lifetime: Expected owns the stored value or error.
// Links: src/support/expected.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tbox::support
{

/// @brief Categories of failures reported by tbox.
enum class ErrorCode
{
    InvalidBorderValue, ///< A side or corner names an unknown glyph kind.
    InvalidBorderShape, ///< The border value is neither a glyph set nor a mapping.
    InvalidPadding,     ///< Padding shorthand has the wrong arity or a negative value.
    InvalidStyle,       ///< A colour or attribute name is not recognised.
    InvalidCount        ///< Tile count is smaller than one.
};

/// @brief Single error with a human-readable message.
struct Error
{
    ErrorCode code;      ///< Failure category
    std::string message; ///< Text naming the offending value and option
};

/// @brief Expected-style container pairing a value with an Error on failure.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected until it is available on every
///       toolchain we target.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled for Error and Expected arguments so the error and
    ///          copy constructors win.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(Error error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const Error &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

/// @brief Expected specialization for operations without a payload.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(Error error);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @brief Access the error describing the failure.
    const Error &error() const &;

  private:
    std::optional<Error> error_;
};

/// @brief Build an Error from a code and message.
Error makeError(ErrorCode code, std::string message);

/// @brief Return the lowercase name of @p code, e.g. "invalid-border-value".
const char *toString(ErrorCode code);

} // namespace tbox::support
