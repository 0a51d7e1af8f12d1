#ifndef _POLLWATCH_LATCH_HPP_
#define _POLLWATCH_LATCH_HPP_

#include <chrono>
#include <mutex>
#include <condition_variable>

// One-shot signal: once set it stays set and releases every waiter.
class Latch {

    public:
        // true only for the call that actually set the latch
        bool set();
        bool is_set() const;

        void wait();
        bool wait_for( std::chrono::nanoseconds timeout );

    private:
        mutable std::mutex _mutex;
        std::condition_variable _set_cv;
        bool _set = false;

};

#endif // _POLLWATCH_LATCH_HPP_
