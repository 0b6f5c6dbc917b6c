#pragma once

#include <string>

namespace BlockSync {
    struct Version {
        static constexpr int MAJOR = 0;
        static constexpr int MINOR = 4;
        static constexpr int PATCH = 0;
        static constexpr const char* STRING = "0.4.0";

        static std::string toString() {
            return std::string(STRING);
        }
    };
}
