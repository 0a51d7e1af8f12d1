#ifndef _POLLWATCH_WATCHER_HPP_
#define _POLLWATCH_WATCHER_HPP_

#include "channel.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "file_info.hpp"
#include "latch.hpp"
#include "snapshot_store.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

// Polling watcher.
//
// start() runs the poll loop on the calling thread until close(). Each cycle
// lists every root, diffs against the last committed snapshot, hands the
// events one by one to events(), then commits and sleeps. Both channels are
// unbuffered: a consumer that stops draining events() or errors() stalls the
// loop. Configuration calls are safe from any thread and apply from the next
// cycle on. A watcher can run once; after close() it cannot be restarted.
class Watcher {
    public:
        // Create a new unstarted watcher
        Watcher();

        ~Watcher();

        // Watch a file, or a directory and its immediate children
        void add( const std::string& path );

        // Watch a file, or a directory and all of its descendants
        void add_recursive( const std::string& path );

        // Stop watching path and, for a directory, its immediate children
        void remove( const std::string& path );

        // Stop watching path and everything tracked below it
        void remove_recursive( const std::string& path );

        // Stop watching paths and never list them again
        void ignore( const std::vector<std::string>& paths );
        void ignore( const std::string& path );

        // Deliver at most max_events per cycle, 0 for no limit
        void set_max_events( int max_events );

        // Skip entries whose name starts with a dot
        void ignore_hidden_files( bool ignore );

        // Only deliver these operations, empty for all
        void filter_ops( const std::vector<Event::Op>& ops );

        // Copy of the last committed snapshot
        Snapshot watched_files() const;

        // Run the poll loop, blocking until close()
        void start( std::chrono::nanoseconds interval );

        // Wait until start() has been called
        void wait();

        // Send a synthetic event with path "-". false if the watcher closed.
        bool trigger_event( Event::Op op );
        bool trigger_event( Event::Op op, const FileInfo& info );

        // Stop the loop and forget roots and snapshot. No-op if not running.
        void close();

        bool is_running() const;

        // Closed signal, set once when the loop has terminated
        bool closed() const { return _closed.is_set(); }
        void wait_closed() { _closed.wait(); }
        bool wait_closed_for( std::chrono::nanoseconds timeout ) { return _closed.wait_for( timeout ); }

        Channel<Event>& events() { return _events; }
        Channel<std::exception_ptr>& errors() { return _errors; }

    private:
        mutable std::mutex _mutex;
        std::condition_variable _wake_cv;

        SnapshotStore _store;
        Dispatcher::Policy _policy;
        bool _ignore_hidden = false;
        bool _running = false;
        bool _stopped = false;

        Channel<Event> _events;
        Channel<std::exception_ptr> _errors;
        Latch _started;
        Latch _closed;

        void add_root( const std::string& name, bool recursive );
        void poll( std::chrono::nanoseconds interval );

        // List every root (mutex held). Vanished roots are deregistered.
        Snapshot gather( SnapshotStore::Roots& listed, std::vector<std::exception_ptr>& errors );

        Watcher( const Watcher& other ) = delete;
        Watcher& operator=( const Watcher& other ) = delete;
};

#endif // _POLLWATCH_WATCHER_HPP_
