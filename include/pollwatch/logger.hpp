#ifndef _POLLWATCH_LOGGER_HPP_
#define _POLLWATCH_LOGGER_HPP_

#include <string>

// Minimal leveled logger writing to stderr.
// The initial level comes from POLLWATCH_LOG (debug, info, error, none).
class Logger {
    public:
        enum class Level {
            DEBUG,
            INFO,
            ERROR,
            NONE,
        };

        static void set_level( Level level );

        static void debug( const std::string& msg );
        static void info( const std::string& msg );
        static void error( const std::string& msg );

    private:
        static void write( Level level, const char* tag, const std::string& msg );
};

#endif // _POLLWATCH_LOGGER_HPP_
