/**
 * @file SourceFactory.cpp
 * @brief Implementation of the SourceFactory.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/input/SourceFactory.hpp>
#include <pensteer/input/NetSource.hpp>
#include <pensteer/core/Log.hpp>
#include <pensteer/core/Platform.hpp>

#ifdef PENSTEER_OS_LINUX
    #include <pensteer/input/EvdevSource.hpp>
#endif

namespace pensteer::input {

std::string_view toString(SourceKind kind) noexcept
{
    switch (kind)
    {
        case SourceKind::kNone:  return "Disabled";
        case SourceKind::kNet:   return "Network (over UDP)";
        case SourceKind::kEvdev: return "Evdev (Linux)";
    }
    return "Unknown";
}

core::Expected<std::unique_ptr<ISource>> SourceFactory::create(const SourceConfig& config)
{
    switch (config.kind)
    {
        case SourceKind::kNone:
            return std::make_unique<DummySource>();

        case SourceKind::kNet:
        {
            auto source = PENSTEER_TRY(NetSource::create(config.netAddress));
            return std::unique_ptr<ISource>{std::move(source)};
        }

        case SourceKind::kEvdev:
#ifdef PENSTEER_OS_LINUX
        {
            auto source = PENSTEER_TRY(EvdevSource::create(config.preferredTablet));
            return std::unique_ptr<ISource>{std::move(source)};
        }
#else
            return core::makeError(core::ErrorCode::kNotSupported,
                                   "evdev sources are only available on Linux");
#endif
    }

    return core::makeError(core::ErrorCode::kInvalidArgument, "unknown source kind");
}

std::vector<SourceKind> SourceFactory::availableKinds()
{
#ifdef PENSTEER_OS_LINUX
    return {SourceKind::kNone, SourceKind::kNet, SourceKind::kEvdev};
#else
    return {SourceKind::kNone, SourceKind::kNet};
#endif
}

SourceKind SourceFactory::defaultKind() noexcept
{
#ifdef PENSTEER_OS_LINUX
    return SourceKind::kEvdev;
#else
    return SourceKind::kNone;
#endif
}

} // namespace pensteer::input
