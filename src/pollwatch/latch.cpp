#include "latch.hpp"

bool Latch::set() {
    std::unique_lock<std::mutex> lock{_mutex};
    if( _set ) {
        return false;
    }
    _set = true;
    _set_cv.notify_all();
    return true;
}

bool Latch::is_set() const {
    std::unique_lock<std::mutex> lock{_mutex};
    return _set;
}

void Latch::wait() {
    std::unique_lock<std::mutex> lock{_mutex};
    _set_cv.wait( lock, [this]{ return _set; } );
}

bool Latch::wait_for( std::chrono::nanoseconds timeout ) {
    std::unique_lock<std::mutex> lock{_mutex};
    return _set_cv.wait_for( lock, timeout, [this]{ return _set; } );
}
