#include "common.hpp"
#include "errors.hpp"

#include <sstream>
#include <iterator>

#include <unistd.h>
#include <limits.h>
#include <errno.h>

std::vector<std::string> split( const std::string& str ) {
    std::istringstream iss{ str };
    std::vector<std::string> words{
        std::istream_iterator<std::string>{iss},
        std::istream_iterator<std::string>{}
    };

    return words;
}

std::string basename( const std::string& str ) {
    auto last = str.rfind( "/" );
    if( last != std::string::npos ) {
        return std::string{ str, last+1 };
    } else {
        return std::string{ str };
    }
}

std::string dirname( const std::string& str ) {
    auto last = str.rfind( "/" );
    if( last == std::string::npos ) {
        return std::string{"."};
    }
    if( last == 0 ) {
        return std::string{"/"};
    }
    return std::string{ str, 0, last };
}

std::string join_path( const std::string& dir, const std::string& name ) {
    if( dir.empty() ) {
        return name;
    }
    if( dir.back() == '/' ) {
        return dir + name;
    }
    return dir + std::string{"/"} + name;
}

std::string clean_path( const std::string& path ) {
    if( path.empty() ) {
        return std::string{"."};
    }
    bool rooted = path[0] == '/';

    std::vector<std::string> parts;
    std::string::size_type pos = 0;
    while( pos <= path.size() ) {
        auto next = path.find( '/', pos );
        if( next == std::string::npos ) {
            next = path.size();
        }
        std::string part{ path, pos, next-pos };
        pos = next + 1;

        if( part.empty() || part == "." ) {
            continue;
        }
        if( part == ".." ) {
            if( !parts.empty() && parts.back() != ".." ) {
                parts.pop_back();
            } else if( !rooted ) {
                parts.push_back( part );
            }
            // ".." above the root stays at the root
            continue;
        }
        parts.push_back( part );
    }

    std::string cleaned = rooted ? std::string{"/"} : std::string{};
    for( size_t i=0; i<parts.size(); i++ ) {
        if( i > 0 ) {
            cleaned += '/';
        }
        cleaned += parts[i];
    }
    if( cleaned.empty() ) {
        return std::string{"."};
    }
    return cleaned;
}

std::string absolute_path( const std::string& path ) {
    if( !path.empty() && path[0] == '/' ) {
        return clean_path( path );
    }
    char cwd[PATH_MAX];
    if( getcwd( cwd, sizeof(cwd) ) == NULL ) {
        throw_errno( path, errno );
    }
    return clean_path( join_path( std::string{cwd}, path ) );
}

bool has_prefix( const std::string& str, const std::string& prefix ) {
    return str.size() >= prefix.size() && str.compare( 0, prefix.size(), prefix ) == 0;
}

bool is_hidden( const std::string& path ) {
    auto name = basename( path );
    return !name.empty() && name[0] == '.';
}
