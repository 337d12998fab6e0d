/**
 * @file EvdevSource.cpp
 * @brief evdev tablet source and device enumeration.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/input/EvdevSource.hpp>
#include <pensteer/math/Angle.hpp>
#include <pensteer/core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string_view>

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace pensteer::input {

namespace {

constexpr core::usize kBitsPerLong = sizeof(unsigned long) * 8;

constexpr core::usize bitArraySize(core::usize bits)
{
    return (bits + kBitsPerLong - 1) / kBitsPerLong;
}

template <core::usize N>
bool testBit(const std::array<unsigned long, N>& bits, core::usize bit)
{
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1ul;
}

bool hasTabletAxes(int fd)
{
    std::array<unsigned long, bitArraySize(EV_MAX + 1)> evBits{};
    if (::ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits.data()) < 0 || !testBit(evBits, EV_ABS))
        return false;

    std::array<unsigned long, bitArraySize(ABS_MAX + 1)> absBits{};
    if (::ioctl(fd, EVIOCGBIT(EV_ABS, sizeof(absBits)), absBits.data()) < 0)
        return false;

    return testBit(absBits, ABS_X) && testBit(absBits, ABS_Y) && testBit(absBits, ABS_PRESSURE);
}

std::string readName(int fd)
{
    std::array<char, 256> name{};
    if (::ioctl(fd, EVIOCGNAME(name.size() - 1), name.data()) < 0)
        return {};
    return std::string(name.data());
}

core::Expected<AxisRange> readAxis(int fd, unsigned axis)
{
    input_absinfo info{};
    if (::ioctl(fd, EVIOCGABS(axis), &info) < 0)
    {
        return core::makeError(core::ErrorCode::kDeviceReadFailed,
                               std::string("EVIOCGABS: ") + std::strerror(errno));
    }
    if (info.maximum <= info.minimum)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "degenerate axis range");
    }
    return AxisRange{info.minimum, info.maximum, info.resolution};
}

core::f32 physicalExtent(const AxisRange& axis)
{
    const auto units = static_cast<core::f32>(axis.maximum - axis.minimum);
    return axis.resolution > 0 ? units / static_cast<core::f32>(axis.resolution) : units;
}

core::u8 buttonBit(core::u16 code)
{
    switch (code)
    {
        case BTN_STYLUS:  return 1u << 0;
        case BTN_STYLUS2: return 1u << 1;
#ifdef BTN_STYLUS3
        case BTN_STYLUS3: return 1u << 2;
#endif
        default:          return 0;
    }
}

} // anonymous namespace

// ========================================================================== //
//  TabletNormalizer                                                          //
// ========================================================================== //

TabletNormalizer::TabletNormalizer(AxisRange x, AxisRange y) noexcept
    : _x{x}
    , _y{y}
{
    const core::f32 height = physicalExtent(_y);
    if (height > 0.0f)
        _aspectRatio = physicalExtent(_x) / height;
}

math::Vec2 TabletNormalizer::normalize(core::i32 rawX, core::i32 rawY) const noexcept
{
    math::Vec2 out{
        math::remap(static_cast<core::f32>(rawX), static_cast<core::f32>(_x.minimum),
                    static_cast<core::f32>(_x.maximum), -1.0f, 1.0f),
        math::remap(static_cast<core::f32>(rawY), static_cast<core::f32>(_y.minimum),
                    static_cast<core::f32>(_y.maximum), -1.0f, 1.0f),
    };

    if (_aspectRatio > 1.0f)
        out.x = std::clamp(out.x * _aspectRatio, -1.0f, 1.0f);
    else if (_aspectRatio < 1.0f)
        out.y = std::clamp(out.y / _aspectRatio, -1.0f, 1.0f);

    return out;
}

// ========================================================================== //
//  Enumeration                                                               //
// ========================================================================== //

core::Expected<std::vector<TabletInfo>> enumerateTablets()
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::directory_iterator it{"/dev/input", ec};
    if (ec)
    {
        return core::makeError(core::ErrorCode::kNotFound, "/dev/input: " + ec.message());
    }

    std::vector<TabletInfo> tablets;
    for (const auto& entry : it)
    {
        const std::string file = entry.path().filename().string();
        if (!file.starts_with("event"))
            continue;

        const std::string_view suffix = std::string_view(file).substr(5);
        if (suffix.empty() || !std::all_of(suffix.begin(), suffix.end(),
                                           [](char c) { return c >= '0' && c <= '9'; }))
            continue;

        if (!entry.is_character_file(ec))
            continue;

        const int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0)
            continue;

        if (hasTabletAxes(fd))
            tablets.push_back(TabletInfo{entry.path().string(), readName(fd)});

        ::close(fd);
    }

    std::sort(tablets.begin(), tablets.end(),
              [](const TabletInfo& a, const TabletInfo& b) { return a.path < b.path; });
    return tablets;
}

// ========================================================================== //
//  EvdevSource                                                               //
// ========================================================================== //

EvdevSource::EvdevSource(PrivateTag, int fd, std::string deviceName, TabletNormalizer normalizer) noexcept
    : _fd{fd}
    , _deviceName{std::move(deviceName)}
    , _normalizer{normalizer}
{}

EvdevSource::~EvdevSource()
{
    if (_fd >= 0)
        ::close(_fd);
}

core::Expected<std::unique_ptr<EvdevSource>> EvdevSource::create(
    const std::optional<std::string>& preferredName)
{
    const auto tablets = PENSTEER_TRY(enumerateTablets());
    if (tablets.empty())
    {
        return core::makeError(core::ErrorCode::kDeviceNotFound,
                               "no readable tablet found under /dev/input");
    }

    if (!preferredName.has_value())
        return openPath(tablets.front().path);

    const auto match = std::find_if(tablets.begin(), tablets.end(),
                                    [&](const TabletInfo& t) { return t.name == *preferredName; });
    if (match == tablets.end())
    {
        return core::makeError(core::ErrorCode::kDeviceNotFound,
                               "tablet '" + *preferredName + "' not found");
    }
    return openPath(match->path);
}

core::Expected<std::unique_ptr<EvdevSource>> EvdevSource::openPath(const std::string& path)
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
    {
        const auto code = errno == EACCES ? core::ErrorCode::kPermissionDenied
                                          : core::ErrorCode::kDeviceOpenFailed;
        return core::makeError(code, path + ": " + std::strerror(errno));
    }

    auto x = readAxis(fd, ABS_X);
    auto y = readAxis(fd, ABS_Y);
    if (!x.has_value() || !y.has_value())
    {
        ::close(fd);
        return std::unexpected((x.has_value() ? y.error() : x.error()).withContext(path));
    }

    std::string deviceName = readName(fd);
    core::Log::info("Evdev", "opened " + path + " (" + deviceName + ")");
    return std::make_unique<EvdevSource>(PrivateTag{}, fd, std::move(deviceName),
                                         TabletNormalizer{*x, *y});
}

core::Expected<std::optional<PenSample>> EvdevSource::poll()
{
    std::optional<PenSample> latest;
    std::array<input_event, 64> events{};

    for (;;)
    {
        const auto bytes = ::read(_fd, events.data(), sizeof(events));
        if (bytes < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            return core::makeError(core::ErrorCode::kDeviceReadFailed,
                                   _deviceName + ": " + std::strerror(errno));
        }
        if (bytes == 0)
            break;

        const auto count = static_cast<core::usize>(bytes) / sizeof(input_event);
        for (core::usize i = 0; i < count; ++i)
        {
            const input_event& ev = events[i];
            if (ev.type == EV_SYN)
            {
                if (ev.code == SYN_DROPPED)
                {
                    _dropping = true;
                }
                else if (ev.code == SYN_REPORT)
                {
                    if (!_dropping)
                    {
                        const math::Vec2 pos = _normalizer.normalize(_rawX, _rawY);
                        latest = PenSample{pos.x, pos.y, _pressure, _buttons};
                    }
                    _dropping = false;
                }
                continue;
            }

            if (_dropping)
                continue;

            if (ev.type == EV_ABS)
            {
                switch (ev.code)
                {
                    case ABS_X:        _rawX = ev.value; break;
                    case ABS_Y:        _rawY = ev.value; break;
                    case ABS_PRESSURE: _pressure = ev.value > 0 ? static_cast<core::u32>(ev.value) : 0u; break;
                    default: break;
                }
            }
            else if (ev.type == EV_KEY)
            {
                const core::u8 bit = buttonBit(ev.code);
                _buttons = ev.value ? static_cast<core::u8>(_buttons | bit)
                                    : static_cast<core::u8>(_buttons & ~bit);
            }
        }
    }

    return latest;
}

} // namespace pensteer::input
