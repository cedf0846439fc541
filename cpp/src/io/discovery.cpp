// ==============================================================================
// discovery.cpp - Поиск entry.json
// ==============================================================================

#include "bilicache/discovery.hpp"

#include <algorithm>
#include <system_error>

namespace bilicache::io {

namespace {

void record_skip(DiscoveryResult& result, const std::filesystem::path& path,
                 const std::string& what, const std::error_code& ec) {
    result.skipped.push_back(DiscoverySkip{path, what + " - " + ec.message()});
}

/// Ссылка на несуществующую цель: ничего не потеряно, не считается пропуском
bool is_dangling_symlink(const std::filesystem::directory_entry& entry,
                         const std::error_code& status_ec) {
    if (status_ec != std::errc::no_such_file_or_directory) {
        return false;
    }
    std::error_code link_ec;
    return entry.is_symlink(link_ec) && !link_ec;
}

/// Рекурсивно обходит директорию и собирает совпадения по имени файла
void collect_entries(const std::filesystem::path& root, const std::filesystem::path& dir,
                     const std::string& file_name, DiscoveryResult& result) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        // Нет доступа или директория исчезла во время обхода
        record_skip(result, dir, "failed to read directory", ec);
        return;
    }

    const std::filesystem::directory_iterator end;
    while (it != end) {
        const std::filesystem::path entry_path = it->path();

        std::error_code status_ec;
        std::filesystem::file_status status = it->status(status_ec);

        if (status_ec) {
            if (!is_dangling_symlink(*it, status_ec)) {
                record_skip(result, entry_path, "failed to get metadata", status_ec);
            }
        } else if (std::filesystem::is_directory(status)) {
            collect_entries(root, entry_path, file_name, result);
        } else if (std::filesystem::is_regular_file(status) &&
                   entry_path.filename() == file_name) {
            result.entries.push_back(
                DiscoveredEntry{entry_path, entry_path.lexically_relative(root)});
        }
        // Специальные файлы игнорируются

        it.increment(ec);
        if (ec) {
            record_skip(result, dir, "failed to continue reading directory", ec);
            return;
        }
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

DiscoveryResult discover_entries(const std::filesystem::path& root,
                                 const DiscoveryOptions& opt) {
    DiscoveryResult result;

    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(root, ec);
    if (ec) {
        record_skip(result, root, "failed to get metadata", ec);
        return result;
    }
    if (!std::filesystem::is_directory(status)) {
        result.skipped.push_back(DiscoverySkip{root, "not a directory"});
        return result;
    }

    collect_entries(root, root, opt.file_name, result);

    // Порядок directory_iterator зависит от ОС, сортируем для детерминизма
    std::sort(result.entries.begin(), result.entries.end(),
              [](const DiscoveredEntry& a, const DiscoveredEntry& b) {
                  return a.absolute_path < b.absolute_path;
              });

    return result;
}

}  // namespace bilicache::io
