#pragma once

#include "core/progress_channel.hpp"

#include <string>

enum class ExtractError {
    None,
    CorruptArchive,
    DiskFull,
    PermissionDenied
};

struct ExtractResult {
    bool success = false;
    ExtractError error = ExtractError::None;
    int entries = 0;
    std::string message;
};

class Extractor {
public:
    /// Unpack archive_path so that dest_dir ends up holding exactly the
    /// archive's entries. Entries are staged beside dest_dir and swapped in
    /// only after every entry was written; on failure dest_dir is untouched.
    /// A single top-level directory in the archive is flattened away.
    static ExtractResult extract(const std::string& archive_path,
                                 const std::string& dest_dir,
                                 ProgressCallback on_progress = nullptr);

    /// Move source_dir to dest_dir. An existing dest_dir is renamed to
    /// backup_path() first and renamed back if the move fails.
    static ExtractResult replace_dir(const std::string& source_dir,
                                     const std::string& dest_dir);

    static const char* error_name(ExtractError error);

    /// Staging directory used for dest_dir: "<parent>/.<name>.staging"
    static std::string staging_path(const std::string& dest_dir);

    /// Where the previous tree waits during the swap: "<parent>/.<name>.old"
    static std::string backup_path(const std::string& dest_dir);
};
