#ifndef _POLLWATCH_PATH_LISTER_HPP_
#define _POLLWATCH_PATH_LISTER_HPP_

#include "file_info.hpp"

#include <set>
#include <string>

// Builds snapshots of a single watch root.
//
// Entries in the ignore set, and hidden entries when hidden files are
// suppressed, are left out; a skipped directory is never descended into.
// Failures on the root itself are thrown (NotFoundException when it is gone,
// FileSystemException otherwise). Failures below the root only drop the
// affected entry or subtree.
class PathLister {
    public:
        PathLister( const std::set<std::string>& ignored, bool ignore_hidden );

        // path plus, for a directory, its immediate children
        Snapshot list( const std::string& path ) const;

        // path plus every descendant, depth first
        Snapshot list_recursive( const std::string& path ) const;

        // true if the entry at path should not be tracked
        bool skipped( const std::string& path ) const;

    private:
        const std::set<std::string>& _ignored;
        bool _ignore_hidden;

        void walk( const std::string& path, const FileInfo& info, Snapshot& snapshot ) const;
};

#endif // _POLLWATCH_PATH_LISTER_HPP_
