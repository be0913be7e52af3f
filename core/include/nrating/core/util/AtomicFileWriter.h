#pragma once

#include <string>
#include <vector>

namespace nrating::core::util {

struct PendingFile {
    std::string path;
    std::string contents;
};

class AtomicFileWriter {
public:
    // Writes every file to "<path>.tmp" first and only renames them into
    // place once all temporaries are on disk. Existing targets are kept as
    // "<path>.bak" until every rename succeeds. On any failure the
    // temporaries are removed and every target is left as it was.
    // Duplicate paths and directory targets are rejected before writing.
    static bool CommitAll(const std::vector<PendingFile>& files, std::string* error);
};

}  // namespace nrating::core::util
