/**
 * @file CallPacer.hpp
 * @brief Fixed delay between successive calls to the generation backend.
 */

#pragma once

#include <chrono>
#include <functional>

namespace thoughtflow::application::generation {

/**
 * @class CallPacer
 * @brief Sleeps before every call except the first so the backend is not throttled.
 */
class CallPacer {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param delay Pause inserted between two calls; zero disables pacing.
     * @param sleep Sleep implementation, std::this_thread::sleep_for when empty.
     */
    explicit CallPacer(std::chrono::milliseconds delay, SleepFunction sleep = nullptr);

    /** @brief Call right before each backend request. */
    void beforeCall();

    int callCount() const { return m_calls; }
    std::chrono::milliseconds delay() const { return m_delay; }

private:
    std::chrono::milliseconds m_delay;
    SleepFunction m_sleep;
    int m_calls = 0;
};

} // namespace thoughtflow::application::generation
