#include "dispatcher.hpp"

Dispatcher::Dispatcher( Channel<Event>& events, Channel<std::exception_ptr>& errors )
    : _events(events), _errors(errors) {}

void Dispatcher::begin_cycle( const Policy& policy ) {
    _policy = policy;
    _count = 0;
    _delivered = 0;
}

Dispatcher::Result Dispatcher::dispatch( const Event& event ) {
    if( !_policy.ops.empty() && _policy.ops.count( event.op ) == 0 ) {
        return Result::Filtered;
    }

    _count++;
    if( _policy.max_events > 0 && _count > _policy.max_events ) {
        return Result::LimitReached;
    }

    if( !_events.send( event ) ) {
        return Result::Closed;
    }
    _delivered++;
    return Result::Delivered;
}

bool Dispatcher::report( std::exception_ptr error ) {
    return _errors.send( error );
}
