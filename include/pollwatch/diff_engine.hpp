#ifndef _POLLWATCH_DIFF_ENGINE_HPP_
#define _POLLWATCH_DIFF_ENGINE_HPP_

#include "event.hpp"
#include "file_info.hpp"

#include <vector>

// Same size, modification time, permission bits and file type.
// Metadata only: two distinct files with identical metadata also match.
bool same_file( const FileInfo& a, const FileInfo& b );

// Compare two snapshots and return the change events, in this order:
//   1. Write / Chmod for paths present in both (Write first for a path)
//   2. Rename / Move for removed paths matched against created paths
//   3. Create for unmatched new paths
//   4. Remove for unmatched old paths
// Within each group paths come in ascending byte order. A removed path is
// matched against created paths in ascending order; the first match wins.
std::vector<Event> diff( const Snapshot& previous, const Snapshot& current );

#endif // _POLLWATCH_DIFF_ENGINE_HPP_
