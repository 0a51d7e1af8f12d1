#ifndef _POLLWATCH_ERRORS_HPP_
#define _POLLWATCH_ERRORS_HPP_

#include <exception>
#include <string>

class WatcherException : public std::exception {
    public:
        WatcherException(const std::string& msg) : _msg{msg} {}
        virtual const char* what() const noexcept override { return _msg.c_str(); }
    private:
        std::string _msg;
};

// start() called with an interval below one nanosecond
class DurationTooShortException : public WatcherException {
    public:
        DurationTooShortException()
            : WatcherException{ "error: duration is less than 1ns" } {}
};

// start() called while the poll loop is already running
class AlreadyRunningException : public WatcherException {
    public:
        AlreadyRunningException()
            : WatcherException{ "error: watcher is already running" } {}
};

// start() called on a watcher that was already closed
class WatcherClosedException : public WatcherException {
    public:
        WatcherClosedException()
            : WatcherException{ "error: watcher is closed" } {}
};

// A registered root disappeared between two poll cycles
class WatchedFileDeletedException : public WatcherException {
    public:
        WatchedFileDeletedException(const std::string& path)
            : WatcherException{ std::string{"error: watched file or folder deleted: "} + path },
              _path{path} {}
        const std::string& path() const { return _path; }
    private:
        std::string _path;
};

class FileSystemException : public WatcherException {
    public:
        FileSystemException(const std::string& path, int error_code);
        const std::string& path() const { return _path; }
        int error_code() const { return _error_code; }
    private:
        std::string _path;
        int _error_code;
};

class NotFoundException : public FileSystemException {
    public:
        NotFoundException(const std::string& path, int error_code)
            : FileSystemException{ path, error_code } {}
};

// Throw NotFoundException or FileSystemException for errno
void throw_errno( const std::string& path, int error_code );

#endif // _POLLWATCH_ERRORS_HPP_
