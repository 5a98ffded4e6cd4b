/**
 * @file CallPacer.cpp
 * @brief Implementation of CallPacer.
 */

#include "application/generation/CallPacer.hpp"

#include <thread>

namespace thoughtflow::application::generation {

CallPacer::CallPacer(std::chrono::milliseconds delay, SleepFunction sleep)
    : m_delay(delay), m_sleep(std::move(sleep)) {
    if (!m_sleep) {
        m_sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void CallPacer::beforeCall() {
    if (m_calls > 0 && m_delay.count() > 0) {
        m_sleep(m_delay);
    }
    ++m_calls;
}

} // namespace thoughtflow::application::generation
