#include "logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace {

Logger::Level level_from_env() {
    const char* env = std::getenv( "POLLWATCH_LOG" );
    if( env == NULL ) {
        return Logger::Level::INFO;
    }
    std::string value{ env };
    if( value == "debug" ) {
        return Logger::Level::DEBUG;
    } else if( value == "error" ) {
        return Logger::Level::ERROR;
    } else if( value == "none" ) {
        return Logger::Level::NONE;
    }
    return Logger::Level::INFO;
}

std::atomic<int>& current_level() {
    static std::atomic<int> level{ static_cast<int>( level_from_env() ) };
    return level;
}

std::mutex output_mutex;

}

void Logger::set_level( Level level ) {
    current_level().store( static_cast<int>(level) );
}

void Logger::debug( const std::string& msg ) {
    write( Level::DEBUG, "[DEBUG] ", msg );
}

void Logger::info( const std::string& msg ) {
    write( Level::INFO, "[INFO] ", msg );
}

void Logger::error( const std::string& msg ) {
    write( Level::ERROR, "[ERROR] ", msg );
}

void Logger::write( Level level, const char* tag, const std::string& msg ) {
    if( static_cast<int>(level) < current_level().load() ) {
        return;
    }
    std::lock_guard<std::mutex> lock{ output_mutex };
    std::cerr << tag << msg << std::endl;
}
