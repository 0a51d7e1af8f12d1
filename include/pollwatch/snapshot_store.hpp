#ifndef _POLLWATCH_SNAPSHOT_STORE_HPP_
#define _POLLWATCH_SNAPSHOT_STORE_HPP_

#include "file_info.hpp"

#include <map>
#include <set>
#include <string>

// Watch roots, ignore set and the last committed snapshot.
// Not synchronized: the owning Watcher guards every call with its mutex.
class SnapshotStore {
    public:
        // root path -> recursive flag
        using Roots = std::map<std::string, bool>;

        // Register root and merge its current listing into the snapshot.
        // Re-adding a root overwrites its recursive flag.
        void add_root( const std::string& path, bool recursive, const Snapshot& listing );

        // Drop root, path itself and, for a directory, its immediate children
        void remove_root( const std::string& path );

        // Drop root and every entry whose path starts with path
        void remove_root_recursive( const std::string& path );

        // Purge path (roots included) by prefix, then blacklist it
        void ignore( const std::string& path );

        bool is_ignored( const std::string& path ) const { return _ignored.count( path ) > 0; }

        // true if entry belongs to one of roots
        static bool covers( const Roots& roots, const std::string& path );

        // Replace the snapshot with next. listed_roots are the roots next was
        // built from; configuration changes made since are carried over.
        void commit( Snapshot next, const Roots& listed_roots );

        // Forget everything but the ignore set
        void clear();

        const Snapshot& files() const { return _files; }
        const Roots& roots() const { return _roots; }
        const std::set<std::string>& ignored() const { return _ignored; }

    private:
        Snapshot _files;
        Roots _roots;
        std::set<std::string> _ignored;

        bool under_ignored( const std::string& path ) const;
};

#endif // _POLLWATCH_SNAPSHOT_STORE_HPP_
