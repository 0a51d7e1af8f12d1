#ifndef _POLLWATCH_COMMON_HPP_
#define _POLLWATCH_COMMON_HPP_

#include <string>
#include <vector>

// Split string by white spaces.
std::vector<std::string> split( const std::string& str );

// get basename
std::string basename( const std::string& str );

// get parent directory, "/" for top level entries and "." for bare names
std::string dirname( const std::string& str );

// join directory and entry name with a single separator
std::string join_path( const std::string& dir, const std::string& name );

// Lexically clean a path: collapse "//", "." and "..", drop trailing slash.
std::string clean_path( const std::string& path );

// Make path absolute against the current working directory, then clean it.
std::string absolute_path( const std::string& path );

// true if str begins with prefix (plain string comparison)
bool has_prefix( const std::string& str, const std::string& prefix );

// true if the last path element starts with a dot
bool is_hidden( const std::string& path );

#endif // _POLLWATCH_COMMON_HPP_
