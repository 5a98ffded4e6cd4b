/**
 * @file ConsoleRedirect.cpp
 * @brief Implementation of ConsoleRedirect.
 */

#include "infrastructure/ConsoleRedirect.hpp"

namespace thoughtflow::infrastructure {

ConsoleRedirect::ConsoleRedirect(std::ostream& from, std::ostream& to)
    : m_from(from), m_saved(from.rdbuf()) {
    m_from.flush();
    m_from.rdbuf(to.rdbuf());
}

ConsoleRedirect::~ConsoleRedirect() {
    release();
}

void ConsoleRedirect::release() {
    if (!m_saved) return;
    m_from.flush();
    m_from.rdbuf(m_saved);
    m_saved = nullptr;
}

} // namespace thoughtflow::infrastructure
