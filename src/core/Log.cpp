// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace mcphub::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};

    // True while this thread runs the installed callback.
    thread_local auto insideCallback = false;

    struct CallbackScope
    {
        CallbackScope() { insideCallback = true; }
        ~CallbackScope() { insideCallback = false; }
        CallbackScope(const CallbackScope&) = delete;
        CallbackScope& operator=(const CallbackScope&) = delete;
    };

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }

    void writeToStderr(Level level, std::string_view message)
    {
        std::println(stderr, "[{}] {}", levelPrefix(level), message);
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    // Messages logged by the callback itself go to stderr.
    if (insideCallback)
    {
        writeToStderr(level, message);
        return;
    }

    auto const lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        auto const scope = CallbackScope {};
        globalCallback(level, message);
        return;
    }

    writeToStderr(level, message);
}

} // namespace mcphub::log
