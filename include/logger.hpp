// include/logger.hpp
#pragma once

#include <iostream>
#include <string>

namespace ChunkFix
{

    // Level-tagged diagnostics. Payload meant for the operator (manifest
    // lines, repair commands) is printed to stdout directly, not through here.
    class Logger
    {
    public:
        static void setVerbose(bool enabled) { verboseFlag() = enabled; }

        static void debug(const std::string &msg)
        {
            if (verboseFlag())
                std::cerr << "\033[1;94m[DEBUG] " << msg << "\033[0m" << std::endl;
        }
        static void info(const std::string &msg)
        {
            std::cerr << "\033[1;32m[INFO] " << msg << "\033[0m" << std::endl;
        }
        static void warning(const std::string &msg)
        {
            std::cerr << "\033[1;33m[WARNING] " << msg << "\033[0m" << std::endl;
        }
        static void error(const std::string &msg)
        {
            std::cerr << "\033[1;35m[ERROR] " << msg << "\033[0m" << std::endl;
        }

    private:
        static bool &verboseFlag()
        {
            static bool enabled = false;
            return enabled;
        }
    };

} // namespace ChunkFix
