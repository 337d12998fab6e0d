/**
 * @file SourceFactory.hpp
 * @brief Factory for creating ISource instances from configuration.
 *
 * There is no silent fallback: if the requested source cannot be opened,
 * the error is returned and the caller decides what to do with it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef PENSTEER_INPUT_SOURCEFACTORY_HPP
    #define PENSTEER_INPUT_SOURCEFACTORY_HPP

#include <pensteer/input/ISource.hpp>
#include <pensteer/core/Constants.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pensteer::input {

/** @brief Available pen source backends. */
enum class SourceKind : core::u8 {
    kNone = 0,
    kNet,
    kEvdev
};

/** @brief Display name of a source kind. */
[[nodiscard]] std::string_view toString(SourceKind kind) noexcept;

/** @brief Everything needed to open any source. */
struct SourceConfig
{
    SourceKind                 kind{SourceKind::kNone};
    std::string                netAddress{core::kDefaultNetAddress};
    std::optional<std::string> preferredTablet;

    [[nodiscard]] bool operator==(const SourceConfig&) const = default;
};

/**
 * @brief Instantiates the ISource matching a SourceConfig.
 */
class SourceFactory
{
public:
    SourceFactory() = delete;

    /**
     * @brief Creates and opens a source.
     * @return The source, or the error that prevented opening it.
     *         kNotSupported when the kind is not built for this platform.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<ISource>> create(const SourceConfig& config);

    /** @brief Source kinds compiled in for this platform. */
    [[nodiscard]] static std::vector<SourceKind> availableKinds();

    /** @brief Default kind for this platform. */
    [[nodiscard]] static SourceKind defaultKind() noexcept;
};

} // namespace pensteer::input

#endif // PENSTEER_INPUT_SOURCEFACTORY_HPP
