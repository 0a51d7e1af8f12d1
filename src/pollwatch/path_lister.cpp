#include "path_lister.hpp"

#include "common.hpp"
#include "errors.hpp"
#include "logger.hpp"

PathLister::PathLister( const std::set<std::string>& ignored, bool ignore_hidden )
    : _ignored(ignored), _ignore_hidden(ignore_hidden) {}

bool PathLister::skipped( const std::string& path ) const {
    return _ignored.count( path ) > 0 || ( _ignore_hidden && is_hidden( path ) );
}

Snapshot PathLister::list( const std::string& path ) const {
    Snapshot snapshot;

    auto info = stat_path( path );
    snapshot[path] = info;
    if( !info.is_dir ) {
        return snapshot;
    }

    for( const auto& child : read_dir( path ) ) {
        auto child_path = join_path( path, child.name );
        if( skipped( child_path ) ) {
            continue;
        }
        snapshot[child_path] = child;
    }
    return snapshot;
}

Snapshot PathLister::list_recursive( const std::string& path ) const {
    Snapshot snapshot;

    auto info = stat_path( path );
    if( skipped( path ) ) {
        return snapshot;
    }
    snapshot[path] = info;
    if( !info.is_dir ) {
        return snapshot;
    }

    // errors on the root directory itself are the caller's to handle
    for( const auto& child : read_dir( path ) ) {
        walk( join_path( path, child.name ), child, snapshot );
    }
    return snapshot;
}

void PathLister::walk( const std::string& path, const FileInfo& info, Snapshot& snapshot ) const {
    if( skipped( path ) ) {
        return;
    }
    snapshot[path] = info;
    if( !info.is_dir ) {
        return;
    }

    std::vector<FileInfo> children;
    try {
        children = read_dir( path );
    } catch( FileSystemException& e ) {
        // keep the directory entry, skip its subtree for this cycle
        Logger::debug( std::string{"Skipping "} + path + std::string{": "} + e.what() );
        return;
    }
    for( const auto& child : children ) {
        walk( join_path( path, child.name ), child, snapshot );
    }
}
