// ==============================================================================
// context.cpp - Чтение entry.json (File Context Reader)
// ==============================================================================

#include "bilicache/context.hpp"

#include "bilicache/platform.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace bilicache::io {

namespace {

ReadErrorKind kind_from_error_code(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ReadErrorKind::FileNotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ReadErrorKind::PermissionDenied;
    }
    return ReadErrorKind::IoError;
}

ReadResult make_error(const std::filesystem::path& path, ReadErrorKind kind, std::string message) {
    ReadResult result;
    result.ok = false;
    result.error = ReadError{kind, std::move(message), platform::path_to_utf8(path)};
    return result;
}

ReadResult make_error(const std::filesystem::path& path, const std::string& what,
                      const std::error_code& ec) {
    return make_error(path, kind_from_error_code(ec), what + ": " + ec.message());
}

}  // namespace

// ----------------------------------------------------------------------------
// ReadError
// ----------------------------------------------------------------------------

const char* read_error_kind_to_string(ReadErrorKind kind) {
    switch (kind) {
    case ReadErrorKind::FileNotFound:
        return "FileNotFound";
    case ReadErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ReadErrorKind::NotRegularFile:
        return "NotRegularFile";
    case ReadErrorKind::IoError:
        return "IoError";
    }
    return "IoError";
}

std::string ReadError::format() const {
    return "failed to read file '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// read_context
// ----------------------------------------------------------------------------

ReadResult read_context(const DiscoveredEntry& entry) {
    const std::filesystem::path& path = entry.absolute_path;

    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        return make_error(path, "failed to get metadata", ec);
    }
    if (!std::filesystem::exists(status)) {
        return make_error(path, ReadErrorKind::FileNotFound, "file not found");
    }
    if (!std::filesystem::is_regular_file(status)) {
        return make_error(path, ReadErrorKind::NotRegularFile, "not a regular file");
    }

    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(path, "failed to get file size", ec);
    }

    std::filesystem::file_time_type mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return make_error(path, "failed to get modification time", ec);
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        int err = errno;
        if (err != 0) {
            return make_error(path, "could not open file",
                              std::error_code(err, std::generic_category()));
        }
        return make_error(path, ReadErrorKind::IoError, "could not open file");
    }

    FileContext ctx;
    ctx.content.reserve(static_cast<std::size_t>(size));
    ctx.content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return make_error(path, ReadErrorKind::IoError, "failed to read file content");
    }

    ctx.path = path;
    ctx.relative_path = entry.relative_path;
    ctx.size_bytes = size;
    ctx.last_modified = mtime;
    ctx.relative_dir = entry.relative_path.parent_path();

    ReadResult result;
    result.ok = true;
    result.context = std::move(ctx);
    return result;
}

}  // namespace bilicache::io
