#include "core/extractor.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

ExtractError classify_errno(int err) {
    switch (err) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return ExtractError::DiskFull;
        default:
            return ExtractError::PermissionDenied;
    }
}

ExtractError classify_error_code(const std::error_code& ec) {
    if (ec == std::errc::no_space_on_device) return ExtractError::DiskFull;
    return ExtractError::PermissionDenied;
}

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

int copy_data(struct archive* ar, struct archive* aw) {
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        int r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return ARCHIVE_OK;
        if (r < ARCHIVE_OK) return r;
        r = static_cast<int>(archive_write_data_block(aw, buff, size, offset));
        if (r < ARCHIVE_OK) return r;
    }
}

}  // namespace

const char* Extractor::error_name(ExtractError error) {
    switch (error) {
        case ExtractError::None:             return "none";
        case ExtractError::CorruptArchive:   return "corrupt archive";
        case ExtractError::DiskFull:         return "disk full";
        case ExtractError::PermissionDenied: return "permission denied";
    }
    return "unknown";
}

std::string Extractor::staging_path(const std::string& dest_dir) {
    fs::path dest = fs::path(dest_dir);
    if (!dest.has_filename()) dest = dest.parent_path();
    return (dest.parent_path() / ("." + dest.filename().string() + ".staging")).string();
}

std::string Extractor::backup_path(const std::string& dest_dir) {
    fs::path dest = fs::path(dest_dir);
    if (!dest.has_filename()) dest = dest.parent_path();
    return (dest.parent_path() / ("." + dest.filename().string() + ".old")).string();
}

ExtractResult Extractor::replace_dir(const std::string& source_dir, const std::string& dest_dir) {
    ExtractResult result;
    fs::path dest = fs::path(dest_dir);
    if (!dest.has_filename()) dest = dest.parent_path();
    const fs::path backup = backup_path(dest_dir);

    std::error_code ec;
    fs::remove_all(backup, ec);
    if (ec) {
        result.error = classify_error_code(ec);
        result.message = "cannot clear " + backup.string() + ": " + ec.message();
        return result;
    }

    // The old tree is only renamed aside, so any failure below can put it back
    bool had_dest = fs::exists(dest, ec);
    if (had_dest) {
        fs::rename(dest, backup, ec);
        if (ec) {
            result.error = classify_error_code(ec);
            result.message = "cannot replace " + dest.string() + ": " + ec.message();
            return result;
        }
    }

    fs::rename(source_dir, dest, ec);
    if (ec) {
        result.error = classify_error_code(ec);
        result.message = "cannot move files into " + dest.string() + ": " + ec.message();
        if (had_dest) {
            std::error_code restore_ec;
            fs::rename(backup, dest, restore_ec);
            if (restore_ec) {
                spdlog::error("cannot restore {} from {}: {}", dest.string(), backup.string(),
                              restore_ec.message());
            }
        }
        return result;
    }

    if (had_dest) {
        fs::remove_all(backup, ec);
        if (ec) spdlog::warn("could not remove {}: {}", backup.string(), ec.message());
    }
    result.success = true;
    return result;
}

ExtractResult Extractor::extract(const std::string& archive_path,
                                 const std::string& dest_dir,
                                 ProgressCallback on_progress) {
    ExtractResult result;
    const fs::path staging = staging_path(dest_dir);
    fs::path dest = fs::path(dest_dir);
    if (!dest.has_filename()) dest = dest.parent_path();

    auto fail = [&](ExtractError error, const std::string& msg) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        result.success = false;
        result.error = error;
        result.message = msg;
        spdlog::warn("extract {} failed: {} ({})", archive_path, msg, error_name(error));
        return result;
    };

    std::error_code ec;
    int64_t archive_size = static_cast<int64_t>(fs::file_size(archive_path, ec));
    if (ec) {
        return fail(ExtractError::CorruptArchive, "cannot read " + archive_path + ": " + ec.message());
    }

    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return fail(classify_error_code(ec), "cannot create " + staging.string() + ": " + ec.message());
    }

    spdlog::info("extract {} -> {}", archive_path, dest.string());

    ArchiveReader reader(archive_read_new());
    ArchiveWriter writer(archive_write_disk_new());
    if (!reader || !writer) {
        return fail(ExtractError::DiskFull, "libarchive allocation failed");
    }

    archive_read_support_format_all(reader.get());
    archive_read_support_filter_all(reader.get());

    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(writer.get(), flags);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        return fail(ExtractError::CorruptArchive,
                    "cannot open archive: " + archive_message(reader.get()));
    }

    struct archive_entry* entry = nullptr;
    int64_t reported = 0;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            return fail(ExtractError::CorruptArchive, archive_message(reader.get()));
        }
        if (r < ARCHIVE_OK) {
            spdlog::warn("archive header warning: {}", archive_message(reader.get()));
        }

        std::string rel = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        while (!rel.empty() && (rel[0] == '/' || rel[0] == '\\')) {
            rel.erase(0, 1);
        }
        if (rel.empty() || rel == "." || rel == "./") continue;

        const fs::path full = staging / rel;
        archive_entry_set_pathname(entry, full.string().c_str());
        if (const char* link = archive_entry_hardlink(entry)) {
            std::string target = link;
            while (!target.empty() && (target[0] == '/' || target[0] == '\\')) {
                target.erase(0, 1);
            }
            archive_entry_set_hardlink(entry, (staging / target).string().c_str());
        }

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) {
            return fail(classify_errno(archive_errno(writer.get())),
                        rel + ": " + archive_message(writer.get()));
        }
        if (r < ARCHIVE_OK) {
            spdlog::warn("{}: {}", rel, archive_message(writer.get()));
        }

        if (archive_entry_filetype(entry) == AE_IFREG) {
            r = copy_data(reader.get(), writer.get());
            if (r < ARCHIVE_WARN) {
                // A read-side failure means a truncated or damaged archive.
                if (archive_errno(writer.get()) != 0) {
                    return fail(classify_errno(archive_errno(writer.get())),
                                rel + ": " + archive_message(writer.get()));
                }
                return fail(ExtractError::CorruptArchive, rel + ": " + archive_message(reader.get()));
            }
        }

        r = archive_write_finish_entry(writer.get());
        if (r < ARCHIVE_WARN) {
            return fail(classify_errno(archive_errno(writer.get())),
                        rel + ": " + archive_message(writer.get()));
        }

        ++result.entries;
        if (on_progress) {
            ProgressEvent ev;
            // Seekable formats jump around the file; never report going backwards
            int64_t consumed = archive_filter_bytes(reader.get(), -1);
            if (consumed > archive_size) consumed = archive_size;
            if (consumed > reported) reported = consumed;
            ev.bytes_done = reported;
            ev.bytes_total = archive_size;
            ev.phase = ProgressPhase::Extracting;
            on_progress(ev);
        }
    }

    archive_read_close(reader.get());
    if (archive_write_close(writer.get()) < ARCHIVE_WARN) {
        return fail(classify_errno(archive_errno(writer.get())), archive_message(writer.get()));
    }

    if (result.entries == 0) {
        return fail(ExtractError::CorruptArchive, "archive contains no entries");
    }

    // ── Swap the staged tree into place ──────────────────────────

    fs::path source = staging;
    std::vector<fs::path> top_level;
    for (const auto& item : fs::directory_iterator(staging, ec)) {
        top_level.push_back(item.path());
    }
    if (ec) {
        return fail(classify_error_code(ec), "cannot list " + staging.string() + ": " + ec.message());
    }
    if (top_level.size() == 1 && fs::is_directory(top_level[0], ec)) {
        source = top_level[0];
    }

    ExtractResult swapped = replace_dir(source.string(), dest.string());
    if (!swapped.success) return fail(swapped.error, swapped.message);
    fs::remove_all(staging, ec);

    if (on_progress) {
        ProgressEvent ev;
        ev.bytes_done = archive_size;
        ev.bytes_total = archive_size;
        ev.phase = ProgressPhase::Extracting;
        on_progress(ev);
    }

    result.success = true;
    spdlog::info("extracted {} entries into {}", result.entries, dest.string());
    return result;
}
