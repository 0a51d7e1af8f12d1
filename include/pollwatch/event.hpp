#ifndef _POLLWATCH_EVENT_HPP_
#define _POLLWATCH_EVENT_HPP_

#include "file_info.hpp"

#include <iostream>
#include <string>

// Struct with event information
struct Event {
    // Operation types
    enum class Op {
        Create,
        Write,
        Remove,
        Rename,
        Chmod,
        Move,
    };

    Op op;
    // For Rename and Move: "<old> -> <new>"
    std::string path;
    FileInfo info;
};

std::ostream& operator<<(std::ostream& os, const Event::Op& op);

// FILE "name" OP [path]
std::ostream& operator<<(std::ostream& os, const Event& event);

#endif // _POLLWATCH_EVENT_HPP_
