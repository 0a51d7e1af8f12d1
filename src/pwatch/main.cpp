#include <iostream>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "common.hpp"
#include "watcher.hpp"

void print_usage();
void print_events( Watcher& watcher );
void print_errors( Watcher& watcher );


int main(int argc, char** argv) {
    bool recursive = false;
    bool ignore_hidden = false;
    int interval_ms = 100;
    int max_events = 0;
    std::vector<std::string> paths;

    for( int i=1; i<argc; i++ ) {
        if( std::strcmp( argv[i], "-r" ) == 0 ) {
            recursive = true;
        } else if( std::strcmp( argv[i], "-H" ) == 0 ) {
            ignore_hidden = true;
        } else if( std::strcmp( argv[i], "-i" ) == 0 && i+1 < argc ) {
            interval_ms = std::atoi( argv[++i] );
        } else if( std::strcmp( argv[i], "-m" ) == 0 && i+1 < argc ) {
            max_events = std::atoi( argv[++i] );
        } else if( argv[i][0] == '-' ) {
            print_usage();
            return 1;
        } else {
            paths.push_back( argv[i] );
        }
    }
    if( paths.empty() ) {
        print_usage();
        return 1;
    }
    if( interval_ms < 1 ) {
        std::cerr << "interval must be at least 1ms" << std::endl;
        print_usage();
        return 1;
    }

    Watcher watcher;
    watcher.ignore_hidden_files( ignore_hidden );
    watcher.set_max_events( max_events );

    for( const auto& path : paths ) {
        try {
            if( recursive ) {
                watcher.add_recursive( path );
            } else {
                watcher.add( path );
            }
        } catch( WatcherException& e ) {
            std::cerr << "could not watch '" << path << "': " << e.what() << std::endl;
            return 1;
        }
    }

    std::thread events_thread{ print_events, std::ref(watcher) };
    std::thread errors_thread{ print_errors, std::ref(watcher) };
    std::thread poll_thread{ [&watcher, interval_ms] {
        try {
            watcher.start( std::chrono::milliseconds( interval_ms ) );
        } catch( WatcherException& e ) {
            std::cerr << "could not start: " << e.what() << std::endl;
            // main is blocked reading stdin, there is nothing left to wait for
            std::exit( 1 );
        }
    } };

    // run until EOF or "exit"
    std::string user_input;
    while( std::getline( std::cin, user_input ) ) {
        auto words = split( user_input );
        if( words.size() > 0 && words[0] == "exit" ) {
            break;
        }
    }
    std::cout << "Quitting." << std::endl;

    watcher.close();
    poll_thread.join();
    events_thread.join();
    errors_thread.join();

    return 0;
}

void print_usage() {
    std::cerr << "usage: pwatch [-r] [-H] [-i interval_ms] [-m max_events] path..." << std::endl;
}

void print_events( Watcher& watcher ) {
    Event event{};
    while( watcher.events().receive( event ) ) {
        std::cout << event << std::endl;
    }
}

void print_errors( Watcher& watcher ) {
    std::exception_ptr error;
    while( watcher.errors().receive( error ) ) {
        try {
            std::rethrow_exception( error );
        } catch( std::exception& e ) {
            std::cerr << e.what() << std::endl;
        }
    }
}
