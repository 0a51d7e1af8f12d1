#ifndef _POLLWATCH_DISPATCHER_HPP_
#define _POLLWATCH_DISPATCHER_HPP_

#include "channel.hpp"
#include "event.hpp"

#include <exception>
#include <set>

// Gates diff results onto the public event channel and routes errors.
class Dispatcher {
    public:
        // Delivery policy, copied once per cycle
        struct Policy {
            // empty: forward every operation
            std::set<Event::Op> ops;
            // 0 or less: no limit
            int max_events = 0;
        };

        enum class Result {
            Delivered,
            Filtered,
            LimitReached,
            Closed,
        };

        Dispatcher( Channel<Event>& events, Channel<std::exception_ptr>& errors );

        // Reset the per-cycle counter and take a new policy
        void begin_cycle( const Policy& policy );

        // Forward event, blocking until a consumer takes it.
        // After LimitReached the rest of the cycle must be dropped.
        Result dispatch( const Event& event );

        // Deliver error, blocking until a consumer takes it. false once closed.
        bool report( std::exception_ptr error );

        unsigned int delivered() const { return _delivered; }

    private:
        Channel<Event>& _events;
        Channel<std::exception_ptr>& _errors;
        Policy _policy;
        int _count = 0;
        unsigned int _delivered = 0;
};

#endif // _POLLWATCH_DISPATCHER_HPP_
