/**
 * @file Assert.hpp
 * @brief Debug assertions with source location.
 *
 * PENSTEER_ASSERT is compiled only when PENSTEER_DEBUG is defined and is
 * reserved for programmer errors. Runtime failures go through Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_CORE_ASSERT_HPP
    #define PENSTEER_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace pensteer::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[PENSTEER ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace pensteer::core::detail

    #ifdef PENSTEER_DEBUG
        #define PENSTEER_ASSERT(cond)                                     \
            do {                                                           \
                if (PENSTEER_UNLIKELY(!(cond)))                            \
                    ::pensteer::core::detail::assertFail(#cond);           \
            } while (false)
    #else
        #define PENSTEER_ASSERT(cond) ((void)0)
    #endif

#endif // PENSTEER_CORE_ASSERT_HPP
