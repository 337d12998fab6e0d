/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * PENSTEER_TRY macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_CORE_EXPECTED_HPP
    #define PENSTEER_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace pensteer::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace pensteer::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type pensteer::core::Expected<U>.
 */
#define PENSTEER_TRY(expr)                                                \
    ({                                                                     \
        auto &&_pensteer_result = (expr);                                  \
        if (!_pensteer_result.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_pensteer_result.error()));    \
        std::move(_pensteer_result.value());                               \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type pensteer::core::ExpectedVoid.
 */
#define PENSTEER_TRY_VOID(expr)                                           \
    do {                                                                    \
        auto &&_pensteer_result = (expr);                                  \
        if (!_pensteer_result.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_pensteer_result.error()));    \
    } while (false)

#endif // PENSTEER_CORE_EXPECTED_HPP
