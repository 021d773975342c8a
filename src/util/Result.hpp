/**
 * @file Result.hpp
 * @brief Error type and expected-based result alias used across storage-filler
 *
 * Operations that can be refused or can fail return util::Result<T>, which is a
 * std::expected carrying a util::Error on failure.
 */

#pragma once

#include <expected>
#include <string>
#include <utility>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message and optional code
 *
 * For I/O failures @c code holds the errno value observed at the failing call.
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

/**
 * @brief Value-or-error return type
 *
 * @example
 * ```cpp
 * auto result = controller.start_job(config);
 * if (!result) {
 *     std::cerr << "Error: " << result.error().message << std::endl;
 * }
 * ```
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Build the unexpected half of a Result
 * @param message Error message
 * @param code Optional error code (errno for I/O failures)
 */
[[nodiscard]] inline auto make_error(std::string message, int code = 0)
    -> std::unexpected<Error> {
    return std::unexpected<Error>(Error{std::move(message), code});
}

}  // namespace util
