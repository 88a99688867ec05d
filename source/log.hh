// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "location.hh"

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace gqlc {
    struct Log {
        std::vector<std::string> lines;
        int countErrors = 0;
        int countWarnings = 0;

        template <typename... T>
        bool error(Location const& loc, T const&... args) {
            std::ostringstream buffer;
            ((buffer << loc << ": error: ") << ... << args);
            lines.push_back(buffer.str());
            ++countErrors;
            return false; // convenience
        }

        template <typename... T>
        void warn(Location const& loc, T const&... args) {
            std::ostringstream buffer;
            ((buffer << loc << ": warning: ") << ... << args);
            lines.push_back(buffer.str());
            ++countWarnings;
        }

        template <typename... T>
        void info(Location const& loc, T const&... args) {
            std::ostringstream buffer;
            ((buffer << loc << ": info: ") << ... << args);
            lines.push_back(buffer.str());
        }

        // writes and forgets the collected lines; counters are kept
        void flush(std::ostream& os) {
            for (auto const& line : lines)
                os << line << '\n';
            lines.clear();
        }
    };
}
