// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief pensteer headless entry-point.
///
/// Builds the platform default configuration and runs the controller on a
/// background thread until the process is terminated. Log verbosity comes
/// from the PENSTEER_LOG environment variable.
// /////////////////////////////////////////////////////////////////////////////

#include <pensteer/engine/Controller.hpp>
#include <pensteer/engine/Config.hpp>
#include <pensteer/engine/State.hpp>
#include <pensteer/core/Log.hpp>

#include <cstdlib>
#include <string>
#include <thread>

namespace {

void applyLogLevel()
{
    const char* env = std::getenv("PENSTEER_LOG");
    if (!env)
        return;

    if (auto level = pensteer::core::parseLogLevel(env))
        pensteer::core::Log::setMinLevel(*level);
    else
        pensteer::core::Log::warn(std::string("unknown PENSTEER_LOG level '") + env + "'");
}

} // anonymous namespace

int main(int /*argc*/, char* /*argv*/[])
{
    applyLogLevel();
    pensteer::core::Log::info("=== pensteer ===");

    const auto config = pensteer::engine::Config::Builder{}.build();
    pensteer::core::Log::info(std::string("source: ") +
                              std::string(pensteer::input::toString(config.source().kind)) +
                              ", device: " +
                              std::string(pensteer::device::toString(config.device().kind)));

    pensteer::engine::SharedState state{config};
    pensteer::engine::Controller controller{state};

    std::thread worker{[&controller] { controller.run(); }};
    worker.join();
    return 0;
}
