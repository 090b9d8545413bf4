#include "deploy/archive_extractor.hpp"

#include "deploy/archive_path_policy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <filesystem>
#include <memory>
#include <vector>

namespace mdeploy {

namespace {

// Client data for archive_read_open2. Freed by SourceClose, which libarchive
// also calls when opening fails.
struct SourceCtx {
    IByteSource* src;
    std::vector<std::uint8_t> buffer;
};

la_ssize_t SourceRead(archive* ar, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<SourceCtx*>(client_data);
    const ssize_t n = ctx->src->Read(ctx->buffer);
    if (n < 0) {
        archive_set_error(ar, errno ? errno : EIO, "read from %s failed", ctx->src->Describe().c_str());
        return -1;
    }
    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

int SourceClose(archive*, void* client_data) {
    delete static_cast<SourceCtx*>(client_data);
    return ARCHIVE_OK;
}

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

} // namespace

Result ArchiveExtractor::ExtractToDir(IByteSource& archive_stream,
                                      const std::string& dst_dir,
                                      std::string_view tag,
                                      ExtractStats* stats) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(-1, "Destination is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    auto* ctx = new SourceCtx{&archive_stream, std::vector<std::uint8_t>(64 * 1024)};
    if (archive_read_open2(ar.get(), ctx, nullptr, SourceRead, nullptr, SourceClose) != ARCHIVE_OK) {
        return Result::Fail(-1, "cannot open " + archive_stream.Describe() + ": " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (opt_.restore_owner) flags |= ARCHIVE_EXTRACT_OWNER;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    ExtractStats local{};

    std::uint64_t next_progress =
        (opt_.progress_interval_bytes ? opt_.progress_interval_bytes : (8ULL * 1024 * 1024ULL));

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }
        // GitHub tarballs carry a pax_global_header with the commit id.
        if (rel == "pax_global_header") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        if (archive_entry_filetype(entry) == AE_IFLNK) {
            auto sl_res = path_policy.CheckSymlinkTarget(rel, archive_entry_symlink(entry));
            if (!sl_res.is_ok()) return sl_res;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeLinkTarget(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("[%.*s] entry: %s", (int)tag.size(), tag.data(), target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Result::Fail(-1, "archive_read_data_block: " + ArchiveErr(ar.get()));

            const int ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return Result::Fail(-1, "archive_write_data_block: " + ArchiveErr(aw.get()));

            local.bytes += static_cast<std::uint64_t>(size);
            if (local.bytes >= next_progress) {
                LogDebug("[%.*s] extract progress: %llu bytes",
                         (int)tag.size(), tag.data(), (unsigned long long)local.bytes);
                next_progress = local.bytes + opt_.progress_interval_bytes;
            }
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return Result::Fail(-1, "archive_write_finish_entry: " + ArchiveErr(aw.get()));

        ++local.entries;
        local.top_level.emplace(FirstComponent(rel));
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    LogDebug("[%.*s] extracted %llu entries, %llu bytes",
             (int)tag.size(), tag.data(),
             (unsigned long long)local.entries, (unsigned long long)local.bytes);

    if (stats) *stats = std::move(local);
    return Result::Ok();
}

} // namespace mdeploy
