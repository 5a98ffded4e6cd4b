#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "application/clustering/TreeBuilder.hpp"
#include "infrastructure/ConsoleRedirect.hpp"

using namespace thoughtflow;

int main() {
    std::cout << "[Test] Starting ConsoleRedirect Test..." << std::endl;

    // Plain streams: writes land in the target until the scope ends.
    {
        std::ostringstream out;
        std::ostringstream err;
        {
            infrastructure::ConsoleRedirect redirect(out, err);
            out << "[Component] routed";
        }
        out << "payload";
        assert(err.str() == "[Component] routed");
        assert(out.str() == "payload");
        std::cout << "[PASS] Scoped redirection." << std::endl;
    }

    // Early release restores the stream, and the destructor then does nothing.
    {
        std::ostringstream out;
        std::ostringstream err;
        {
            infrastructure::ConsoleRedirect redirect(out, err);
            out << "log ";
            redirect.release();
            out << "mindmap";
            redirect.release();
        }
        out << "!";
        assert(err.str() == "log ");
        assert(out.str() == "mindmap!");
        std::cout << "[PASS] Early release." << std::endl;
    }

    // Component logs written to std::cout stay out of the captured stdout.
    {
        std::ostringstream fakeStdout;
        std::ostringstream fakeStderr;
        std::streambuf* realCout = std::cout.rdbuf(fakeStdout.rdbuf());
        {
            infrastructure::ConsoleRedirect logsToStderr(std::cout, fakeStderr);
            domain::MindmapSettings settings;
            application::clustering::TreeBuilder builder(settings);
            domain::TextSegment segment;
            segment.index = 0;
            segment.rawText = "Only segment";
            segment.cleanedText = segment.rawText;
            auto tree = builder.build({segment}, {{0.1f, 0.2f}});
            assert(tree.size() == 1);
        }
        std::cout << "{\"rendered\": true}";
        std::cout.rdbuf(realCout);

        assert(fakeStdout.str() == "{\"rendered\": true}");
        assert(fakeStderr.str().find("[TreeBuilder]") != std::string::npos);
        std::cout << "[PASS] Logs routed away from stdout." << std::endl;
    }

    std::cout << "[PASS] ConsoleRedirect Test." << std::endl;
    return 0;
}
