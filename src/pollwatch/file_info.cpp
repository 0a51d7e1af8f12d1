#include "file_info.hpp"

#include "common.hpp"
#include "errors.hpp"

#include <algorithm>

#include <dirent.h>
#include <errno.h>

namespace {

FileInfo from_stat( const std::string& path, const struct stat& st ) {
    FileInfo info;
    info.name = basename( path );
    info.size = static_cast<int64_t>( st.st_size );
    info.mode = st.st_mode & 07777;
    info.mod_time = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds{ st.st_mtim.tv_sec } + std::chrono::nanoseconds{ st.st_mtim.tv_nsec } )
    };
    info.is_dir = S_ISDIR( st.st_mode );
    info.sys = st;
    return info;
}

// closes the DIR handle on every exit path
class DirHandle {
    public:
        DirHandle( DIR* dir ) : _dir{dir} {}
        ~DirHandle() { if( _dir != NULL ) closedir( _dir ); }
        DIR* get() const { return _dir; }
    private:
        DIR* _dir;
        DirHandle( const DirHandle& other ) = delete;
        DirHandle& operator=( const DirHandle& other ) = delete;
};

}

FileInfo stat_path( const std::string& path ) {
    struct stat st;
    if( stat( path.c_str(), &st ) < 0 ) {
        throw_errno( path, errno );
    }
    return from_stat( path, st );
}

FileInfo lstat_path( const std::string& path ) {
    struct stat st;
    if( lstat( path.c_str(), &st ) < 0 ) {
        throw_errno( path, errno );
    }
    return from_stat( path, st );
}

std::vector<FileInfo> read_dir( const std::string& path ) {
    DirHandle dir{ opendir( path.c_str() ) };
    if( dir.get() == NULL ) {
        throw_errno( path, errno );
    }

    std::vector<FileInfo> entries;
    while( true ) {
        errno = 0;
        dirent* entry = readdir( dir.get() );
        if( entry == NULL ) {
            if( errno != 0 ) {
                throw_errno( path, errno );
            }
            break;
        }
        std::string name{ entry->d_name };
        if( name == "." || name == ".." ) {
            continue;
        }
        try {
            entries.push_back( lstat_path( join_path( path, name ) ) );
        } catch( NotFoundException& ) {
            // removed after readdir returned it
        }
    }

    std::sort( entries.begin(), entries.end(),
        []( const FileInfo& a, const FileInfo& b ) { return a.name < b.name; } );
    return entries;
}
