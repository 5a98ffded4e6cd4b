/**
 * @file ConsoleRedirect.hpp
 * @brief Scoped redirection of one standard stream into another.
 */

#pragma once

#include <ostream>
#include <streambuf>

namespace thoughtflow::infrastructure {

/**
 * @class ConsoleRedirect
 * @brief Sends everything written to @p from into @p to until destroyed.
 *
 * The CLI uses it to keep `[Component]` log lines on stderr while the
 * rendered mindmap owns stdout.
 */
class ConsoleRedirect {
public:
    ConsoleRedirect(std::ostream& from, std::ostream& to);
    ~ConsoleRedirect();

    ConsoleRedirect(const ConsoleRedirect&) = delete;
    ConsoleRedirect& operator=(const ConsoleRedirect&) = delete;

    /** Restores the original buffer early. Safe to call more than once. */
    void release();

private:
    std::ostream& m_from;
    std::streambuf* m_saved;
};

} // namespace thoughtflow::infrastructure
