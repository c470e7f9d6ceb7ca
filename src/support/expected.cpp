//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the out-of-line pieces of the Expected helpers: the payload-less
// specialization and the error code names used when errors are logged.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies `Expected<void>` and the error helpers.

#include "tbox/support/expected.hpp"

namespace tbox::support
{

/// @brief Construct an Expected<void> that stores an error state.
/// @param error Error moved into the payload slot.
Expected<void>::Expected(Error error) : error_(std::move(error)) {}

/// @brief Report whether the Expected<void> represents success.
/// @return True if no error is stored.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the stored error; undefined when hasValue() is true.
const Error &Expected<void>::error() const &
{
    return *error_;
}

Error makeError(ErrorCode code, std::string message)
{
    return Error{code, std::move(message)};
}

const char *toString(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::InvalidBorderValue:
            return "invalid-border-value";
        case ErrorCode::InvalidBorderShape:
            return "invalid-border-shape";
        case ErrorCode::InvalidPadding:
            return "invalid-padding";
        case ErrorCode::InvalidStyle:
            return "invalid-style";
        case ErrorCode::InvalidCount:
            return "invalid-count";
    }
    return "unknown";
}

} // namespace tbox::support
