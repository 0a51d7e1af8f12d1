#ifndef _POLLWATCH_CHANNEL_HPP_
#define _POLLWATCH_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>

// Unbuffered handoff between threads.
// send() returns only after a receiver took the value, or once the channel is
// closed. Only one value is in flight at a time; concurrent senders queue up.
template <typename T>
class Channel {
    public:
        enum class Status {
            Ok,
            Timeout,
            Closed,
        };

        Channel() = default;

        // Block until a receiver takes value. false if closed before the handoff.
        bool send( const T& value ) {
            std::unique_lock<std::mutex> lock{_mutex};
            _slot_free_cv.wait( lock, [this]{ return _closed || !_has_value; } );
            if( _closed ) {
                return false;
            }
            _value = value;
            _has_value = true;
            auto ticket = ++_sent;
            _value_ready_cv.notify_one();

            _value_taken_cv.wait( lock, [this, ticket]{ return _closed || _taken >= ticket; } );
            if( _taken >= ticket ) {
                return true;
            }
            // closed with our value still in the slot
            _has_value = false;
            _slot_free_cv.notify_all();
            return false;
        }

        // Block until a value arrives. false once the channel is closed.
        bool receive( T& out ) {
            std::unique_lock<std::mutex> lock{_mutex};
            _value_ready_cv.wait( lock, [this]{ return _closed || _has_value; } );
            return take( out );
        }

        // Like receive(), giving up after timeout.
        template <typename Rep, typename Period>
        Status receive_for( T& out, const std::chrono::duration<Rep, Period>& timeout ) {
            std::unique_lock<std::mutex> lock{_mutex};
            if( !_value_ready_cv.wait_for( lock, timeout, [this]{ return _closed || _has_value; } ) ) {
                return Status::Timeout;
            }
            return take( out ) ? Status::Ok : Status::Closed;
        }

        // Wake every blocked sender and receiver. Further sends fail.
        void close() {
            std::unique_lock<std::mutex> lock{_mutex};
            if( _closed ) {
                return;
            }
            _closed = true;
            _slot_free_cv.notify_all();
            _value_ready_cv.notify_all();
            _value_taken_cv.notify_all();
        }

        bool closed() const {
            std::unique_lock<std::mutex> lock{_mutex};
            return _closed;
        }

    private:
        bool take( T& out ) {
            if( _closed || !_has_value ) {
                return false;
            }
            out = _value;
            _value = T{};
            _has_value = false;
            _taken++;
            _value_taken_cv.notify_all();
            _slot_free_cv.notify_one();
            return true;
        }

        mutable std::mutex _mutex;
        std::condition_variable _slot_free_cv;
        std::condition_variable _value_ready_cv;
        std::condition_variable _value_taken_cv;

        T _value{};
        bool _has_value = false;
        bool _closed = false;
        unsigned long long _sent = 0;
        unsigned long long _taken = 0;

        Channel( const Channel& other ) = delete;
        Channel& operator=( const Channel& other ) = delete;
};

#endif // _POLLWATCH_CHANNEL_HPP_
