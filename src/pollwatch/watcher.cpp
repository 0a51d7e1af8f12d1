#include "watcher.hpp"

#include "common.hpp"
#include "diff_engine.hpp"
#include "logger.hpp"
#include "path_lister.hpp"

#include <sstream>
#include <utility>

Watcher::Watcher() {}

Watcher::~Watcher() {
    close();
    _events.close();
    _errors.close();
}

void Watcher::add( const std::string& path ) {
    add_root( path, false );
}

void Watcher::add_recursive( const std::string& path ) {
    add_root( path, true );
}

void Watcher::add_root( const std::string& name, bool recursive ) {
    auto path = absolute_path( name );

    std::unique_lock<std::mutex> lock{_mutex};
    if( _store.is_ignored( path ) || ( _ignore_hidden && is_hidden( path ) ) ) {
        Logger::debug( std::string{"Not watching ignored path "} + path );
        return;
    }
    PathLister lister{ _store.ignored(), _ignore_hidden };
    auto listing = recursive ? lister.list_recursive( path ) : lister.list( path );
    _store.add_root( path, recursive, listing );
    Logger::info( std::string{"Watching "} + path + ( recursive ? std::string{" (recursive)"} : std::string{} ) );
}

void Watcher::remove( const std::string& name ) {
    auto path = absolute_path( name );

    std::unique_lock<std::mutex> lock{_mutex};
    _store.remove_root( path );
    Logger::info( std::string{"Stopped watching "} + path );
}

void Watcher::remove_recursive( const std::string& name ) {
    auto path = absolute_path( name );

    std::unique_lock<std::mutex> lock{_mutex};
    _store.remove_root_recursive( path );
    Logger::info( std::string{"Stopped watching "} + path + std::string{" (recursive)"} );
}

void Watcher::ignore( const std::vector<std::string>& paths ) {
    for( const auto& name : paths ) {
        auto path = absolute_path( name );

        std::unique_lock<std::mutex> lock{_mutex};
        _store.ignore( path );
        Logger::info( std::string{"Ignoring "} + path );
    }
}

void Watcher::ignore( const std::string& path ) {
    ignore( std::vector<std::string>{ path } );
}

void Watcher::set_max_events( int max_events ) {
    std::unique_lock<std::mutex> lock{_mutex};
    _policy.max_events = max_events;
}

void Watcher::ignore_hidden_files( bool ignore ) {
    std::unique_lock<std::mutex> lock{_mutex};
    _ignore_hidden = ignore;
}

void Watcher::filter_ops( const std::vector<Event::Op>& ops ) {
    std::unique_lock<std::mutex> lock{_mutex};
    _policy.ops = std::set<Event::Op>( ops.begin(), ops.end() );
}

Snapshot Watcher::watched_files() const {
    std::unique_lock<std::mutex> lock{_mutex};
    return _store.files();
}

bool Watcher::is_running() const {
    std::unique_lock<std::mutex> lock{_mutex};
    return _running;
}

void Watcher::start( std::chrono::nanoseconds interval ) {
    if( interval < std::chrono::nanoseconds{1} ) {
        throw DurationTooShortException{};
    }
    {
        std::unique_lock<std::mutex> lock{_mutex};
        if( _stopped ) {
            throw WatcherClosedException{};
        }
        if( _running ) {
            throw AlreadyRunningException{};
        }
        _running = true;
    }
    _started.set();

    std::ostringstream msg;
    msg << "Polling every "
        << std::chrono::duration_cast<std::chrono::milliseconds>( interval ).count() << "ms";
    Logger::info( msg.str() );

    try {
        poll( interval );
    } catch( std::exception& e ) {
        Logger::error( std::string{"Poll loop failed: "} + e.what() );
        {
            std::unique_lock<std::mutex> lock{_mutex};
            _running = false;
            _stopped = true;
        }
        _events.close();
        _errors.close();
        _closed.set();
        throw;
    }

    Logger::info( "Watcher closed" );
    _closed.set();
}

void Watcher::wait() {
    _started.wait();
}

bool Watcher::trigger_event( Event::Op op ) {
    FileInfo info;
    info.name = "triggered event";
    info.mod_time = std::chrono::system_clock::now();
    return trigger_event( op, info );
}

bool Watcher::trigger_event( Event::Op op, const FileInfo& info ) {
    wait();
    return _events.send( Event{ op, std::string{"-"}, info } );
}

void Watcher::close() {
    {
        std::unique_lock<std::mutex> lock{_mutex};
        if( !_running ) {
            return;
        }
        _running = false;
        _stopped = true;
        _store.clear();
        _wake_cv.notify_all();
    }
    // wakes the loop if it is blocked handing over an event or error
    _events.close();
    _errors.close();
    _closed.wait();
}

void Watcher::poll( std::chrono::nanoseconds interval ) {
    Dispatcher dispatcher{ _events, _errors };

    while( true ) {
        SnapshotStore::Roots listed;
        std::vector<std::exception_ptr> errors;
        std::vector<Event> events;
        Dispatcher::Policy policy;
        Snapshot current;
        {
            std::unique_lock<std::mutex> lock{_mutex};
            if( !_running ) {
                return;
            }
            current = gather( listed, errors );
            events = diff( _store.files(), current );
            policy = _policy;
        }

        for( const auto& error : errors ) {
            if( !dispatcher.report( error ) ) {
                return;
            }
        }

        dispatcher.begin_cycle( policy );
        for( const auto& event : events ) {
            auto result = dispatcher.dispatch( event );
            if( result == Dispatcher::Result::Closed ) {
                return;
            }
            if( result == Dispatcher::Result::LimitReached ) {
                std::ostringstream msg;
                msg << "Event limit reached after " << dispatcher.delivered()
                    << " events, dropping the rest of this cycle";
                Logger::debug( msg.str() );
                break;
            }
        }

        std::unique_lock<std::mutex> lock{_mutex};
        if( !_running ) {
            return;
        }
        _store.commit( std::move( current ), listed );
        _wake_cv.wait_for( lock, interval, [this]{ return !_running; } );
    }
}

Snapshot Watcher::gather( SnapshotStore::Roots& listed, std::vector<std::exception_ptr>& errors ) {
    Snapshot snapshot;
    PathLister lister{ _store.ignored(), _ignore_hidden };

    // copied, vanished roots are removed from the store while iterating
    auto roots = _store.roots();
    for( const auto& root : roots ) {
        try {
            auto listing = root.second ? lister.list_recursive( root.first ) : lister.list( root.first );
            snapshot.insert( listing.begin(), listing.end() );
        } catch( NotFoundException& ) {
            Logger::error( std::string{"Watched path deleted: "} + root.first );
            errors.push_back( std::make_exception_ptr( WatchedFileDeletedException{ root.first } ) );
            if( root.second ) {
                _store.remove_root_recursive( root.first );
            } else {
                _store.remove_root( root.first );
            }
            continue;
        } catch( FileSystemException& e ) {
            Logger::error( e.what() );
            errors.push_back( std::current_exception() );
            // keep what was last seen until the root can be listed again
            SnapshotStore::Roots single{ root };
            for( const auto& entry : _store.files() ) {
                if( SnapshotStore::covers( single, entry.first ) ) {
                    snapshot.insert( entry );
                }
            }
        }
        listed.insert( root );
    }
    return snapshot;
}
