/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_CORE_NON_COPYABLE_HPP
    #define PENSTEER_CORE_NON_COPYABLE_HPP

namespace pensteer::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 *
 * Used by every class that owns a kernel handle (sockets, evdev and uinput
 * file descriptors) so that a handle can never be closed twice.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace pensteer::core

#endif // PENSTEER_CORE_NON_COPYABLE_HPP
