#include "snapshot_store.hpp"

#include "common.hpp"

#include <utility>

namespace {

// erase every key of map starting with prefix
template <typename Map>
void erase_prefixed( Map& map, const std::string& prefix ) {
    auto it = map.lower_bound( prefix );
    while( it != map.end() && has_prefix( it->first, prefix ) ) {
        it = map.erase( it );
    }
}

}

void SnapshotStore::add_root( const std::string& path, bool recursive, const Snapshot& listing ) {
    for( const auto& entry : listing ) {
        _files[entry.first] = entry.second;
    }
    _roots[path] = recursive;
}

void SnapshotStore::remove_root( const std::string& path ) {
    _roots.erase( path );

    auto found = _files.find( path );
    if( found == _files.end() ) {
        return;
    }
    bool is_dir = found->second.is_dir;
    _files.erase( found );
    if( !is_dir ) {
        return;
    }

    auto it = _files.begin();
    while( it != _files.end() ) {
        if( dirname( it->first ) == path ) {
            it = _files.erase( it );
        } else {
            ++it;
        }
    }
}

void SnapshotStore::remove_root_recursive( const std::string& path ) {
    _roots.erase( path );
    erase_prefixed( _files, path );
}

void SnapshotStore::ignore( const std::string& path ) {
    erase_prefixed( _roots, path );
    erase_prefixed( _files, path );
    _ignored.insert( path );
}

bool SnapshotStore::covers( const Roots& roots, const std::string& path ) {
    for( const auto& root : roots ) {
        if( path == root.first ) {
            return true;
        }
        if( root.second ) {
            if( has_prefix( path, join_path( root.first, "" ) ) ) {
                return true;
            }
        } else if( dirname( path ) == root.first ) {
            return true;
        }
    }
    return false;
}

void SnapshotStore::commit( Snapshot next, const Roots& listed_roots ) {
    // roots registered while next was being delivered
    for( const auto& entry : _files ) {
        if( !covers( listed_roots, entry.first ) ) {
            next.insert( entry );
        }
    }

    auto it = next.begin();
    while( it != next.end() ) {
        if( !covers( _roots, it->first ) || under_ignored( it->first ) ) {
            it = next.erase( it );
        } else {
            ++it;
        }
    }

    _files = std::move( next );
}

// same boundary as the lister: the ignored path and its subtree, not siblings
bool SnapshotStore::under_ignored( const std::string& path ) const {
    for( const auto& ignored : _ignored ) {
        if( path == ignored || has_prefix( path, join_path( ignored, "" ) ) ) {
            return true;
        }
    }
    return false;
}

void SnapshotStore::clear() {
    _files.clear();
    _roots.clear();
}
