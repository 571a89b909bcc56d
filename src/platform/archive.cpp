#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <cstring>

namespace fs = std::filesystem;

namespace platform {

static std::string archive_err(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

void create_tar(const fs::path& tar_path,
                const fs::path& base_dir,
                const std::vector<std::string>& files) {
    struct archive* a = archive_write_new();
    if (!a) throw std::runtime_error("Failed to create archive writer");

    // pax_restricted writes plain ustar unless a path is too long for it
    archive_write_set_format_pax_restricted(a);

    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_err(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to open tar file: " + err);
    }

    struct archive_entry* entry = archive_entry_new();

    for (const auto& rel_path : files) {
        fs::path full_path = base_dir / rel_path;

        std::error_code ec;
        auto status = fs::status(full_path, ec);
        if (ec || !fs::is_regular_file(status)) {
            archive_entry_free(entry);
            archive_write_free(a);
            throw std::runtime_error("Not a regular file: " + full_path.string());
        }

        auto file_size = fs::file_size(full_path, ec);
        fs::file_time_type mtime{};
        if (!ec) mtime = fs::last_write_time(full_path, ec);
        if (ec) {
            archive_entry_free(entry);
            archive_write_free(a);
            throw std::runtime_error("Cannot stat " + full_path.string() + ": " + ec.message());
        }
        auto mtime_sec = std::chrono::duration_cast<std::chrono::seconds>(
            mtime.time_since_epoch()).count();
        auto perms = static_cast<int>(status.permissions() & fs::perms::mask) & 0777;

        archive_entry_clear(entry);
        archive_entry_set_pathname(entry, rel_path.c_str());
        archive_entry_set_size(entry, static_cast<int64_t>(file_size));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, perms ? perms : 0644);
        archive_entry_set_mtime(entry, mtime_sec, 0);

        // Open before writing the header so an unreadable file never leaves
        // a truncated entry behind.
        std::ifstream in(full_path, std::ios::binary);
        if (!in) {
            archive_entry_free(entry);
            archive_write_free(a);
            throw std::runtime_error("Cannot read file: " + full_path.string());
        }

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            std::string err = archive_err(a);
            archive_entry_free(entry);
            archive_write_free(a);
            throw std::runtime_error("Failed to write tar header for " + rel_path + ": " + err);
        }

        char buf[65536];
        while (in) {
            in.read(buf, sizeof(buf));
            auto bytes_read = in.gcount();
            if (bytes_read > 0) {
                if (archive_write_data(a, buf, static_cast<size_t>(bytes_read)) < 0) {
                    std::string err = archive_err(a);
                    archive_entry_free(entry);
                    archive_write_free(a);
                    throw std::runtime_error("Failed to write tar data for " + rel_path + ": " + err);
                }
            }
        }
    }

    archive_entry_free(entry);
    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string err = archive_err(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to finalize tar file: " + err);
    }
    archive_write_free(a);
}

} // namespace platform
