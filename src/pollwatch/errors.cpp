#include "errors.hpp"

#include <string.h>
#include <errno.h>

FileSystemException::FileSystemException( const std::string& path, int error_code )
    : WatcherException{ std::string{ strerror(error_code) } + std::string{". path: "} + path },
      _path{path},
      _error_code{error_code} {}

void throw_errno( const std::string& path, int error_code ) {
    if( error_code == ENOENT || error_code == ENOTDIR ) {
        throw NotFoundException{ path, error_code };
    }
    throw FileSystemException{ path, error_code };
}
