#include "diff_engine.hpp"

#include "common.hpp"

bool same_file( const FileInfo& a, const FileInfo& b ) {
    return a.mod_time == b.mod_time &&
           a.size == b.size &&
           a.mode == b.mode &&
           a.is_dir == b.is_dir;
}

std::vector<Event> diff( const Snapshot& previous, const Snapshot& current ) {
    std::vector<Event> events;
    Snapshot removes;
    Snapshot creates;

    for( const auto& entry : previous ) {
        if( current.count( entry.first ) == 0 ) {
            removes.insert( entry );
        }
    }

    for( const auto& entry : current ) {
        auto old = previous.find( entry.first );
        if( old == previous.end() ) {
            creates.insert( entry );
            continue;
        }
        if( old->second.mod_time != entry.second.mod_time ) {
            events.push_back( Event{ Event::Op::Write, entry.first, entry.second } );
        }
        if( old->second.mode != entry.second.mode ) {
            events.push_back( Event{ Event::Op::Chmod, entry.first, entry.second } );
        }
    }

    // pairwise, O(removes x creates)
    auto removed = removes.begin();
    while( removed != removes.end() ) {
        bool matched = false;
        for( auto created = creates.begin(); created != creates.end(); ++created ) {
            if( !same_file( removed->second, created->second ) ) {
                continue;
            }
            auto op = dirname( removed->first ) == dirname( created->first )
                ? Event::Op::Rename
                : Event::Op::Move;
            events.push_back( Event{ op, removed->first + " -> " + created->first, removed->second } );
            creates.erase( created );
            matched = true;
            break;
        }
        if( matched ) {
            removed = removes.erase( removed );
        } else {
            ++removed;
        }
    }

    for( const auto& entry : creates ) {
        events.push_back( Event{ Event::Op::Create, entry.first, entry.second } );
    }
    for( const auto& entry : removes ) {
        events.push_back( Event{ Event::Op::Remove, entry.first, entry.second } );
    }

    return events;
}
