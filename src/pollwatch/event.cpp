#include "event.hpp"

std::ostream& operator<<(std::ostream& os, const Event::Op& op) {
    switch(op) {
        case Event::Op::Create:
            os << "CREATE";
            break;
        case Event::Op::Write:
            os << "WRITE";
            break;
        case Event::Op::Remove:
            os << "REMOVE";
            break;
        case Event::Op::Rename:
            os << "RENAME";
            break;
        case Event::Op::Chmod:
            os << "CHMOD";
            break;
        case Event::Op::Move:
            os << "MOVE";
            break;
        default:
            os << "???";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Event& event) {
    os << ( event.info.is_dir ? "DIRECTORY" : "FILE" )
       << " \"" << event.info.name << "\" "
       << event.op
       << " [" << event.path << "]";
    return os;
}
