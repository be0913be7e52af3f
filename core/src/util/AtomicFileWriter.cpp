#include "nrating/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <system_error>
#include <utility>

namespace nrating::core::util {

namespace {

std::string TempPath(const std::string& path) {
    return path + ".tmp";
}

std::string BackupPath(const std::string& path) {
    return path + ".bak";
}

bool Fail(std::string* error, std::string message) {
    std::cerr << "[atomic] " << message << '\n';
    if (error) {
        *error = std::move(message);
    }
    return false;
}

void RemoveTemporaries(const std::vector<PendingFile>& files, size_t first, size_t last) {
    for (size_t i = first; i < last; ++i) {
        std::error_code ec;
        std::filesystem::remove(TempPath(files[i].path), ec);
    }
}

// Undoes a partial commit: the first `placed` targets hold new contents and
// are removed, then every backed-up target is moved back.
void RestoreBackups(const std::vector<PendingFile>& files, const std::vector<bool>& backed_up, size_t placed) {
    for (size_t i = 0; i < placed; ++i) {
        std::error_code ec;
        std::filesystem::remove(files[i].path, ec);
    }
    for (size_t i = 0; i < files.size(); ++i) {
        if (!backed_up[i]) {
            continue;
        }
        std::error_code ec;
        std::filesystem::rename(BackupPath(files[i].path), files[i].path, ec);
        if (ec) {
            std::cerr << "[atomic] Could not restore " << files[i].path << " from " << BackupPath(files[i].path)
                      << ": " << ec.message() << '\n';
        }
    }
}

bool WriteTemporary(const PendingFile& file, std::string* error) {
    const std::filesystem::path fs_path(file.path);
    if (!fs_path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            if (error) {
                *error = "Failed to create directory " + fs_path.parent_path().string() + ": " + ec.message();
            }
            return false;
        }
    }

    const std::string temp_path = TempPath(file.path);
    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        std::cerr << "[atomic] Failed to open temp file: " << temp_path << '\n';
        if (error) {
            *error = "Failed to open temp file: " + temp_path;
        }
        return false;
    }
    output.write(file.contents.data(), static_cast<std::streamsize>(file.contents.size()));
    output.flush();
    if (!output) {
        std::cerr << "[atomic] Failed to write temp file: " << temp_path << '\n';
        if (error) {
            *error = "Failed to write temp file: " + temp_path;
        }
        return false;
    }
    return true;
}

}  // namespace

bool AtomicFileWriter::CommitAll(const std::vector<PendingFile>& files, std::string* error) {
    std::set<std::filesystem::path> targets;
    for (const auto& file : files) {
        std::error_code ec;
        const auto normalized = std::filesystem::absolute(file.path, ec).lexically_normal();
        if (ec) {
            return Fail(error, "Cannot resolve output path " + file.path + ": " + ec.message());
        }
        if (!targets.insert(normalized).second) {
            return Fail(error, "Output path listed twice: " + file.path);
        }
        if (std::filesystem::is_directory(file.path, ec)) {
            return Fail(error, "Output path is a directory: " + file.path);
        }
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (!WriteTemporary(files[i], error)) {
            RemoveTemporaries(files, 0, i + 1);
            return false;
        }
    }

    // Existing targets are moved aside so a failed rename can put them back.
    std::vector<bool> backed_up(files.size(), false);
    for (size_t i = 0; i < files.size(); ++i) {
        std::error_code ec;
        if (!std::filesystem::exists(files[i].path, ec)) {
            continue;
        }
        std::filesystem::rename(files[i].path, BackupPath(files[i].path), ec);
        if (ec) {
            std::cerr << "[atomic] backup failed for " << files[i].path << ": " << ec.message() << '\n';
            RestoreBackups(files, backed_up, 0);
            RemoveTemporaries(files, 0, files.size());
            return Fail(error, "Failed to back up " + files[i].path + ": " + ec.message());
        }
        backed_up[i] = true;
    }

    for (size_t i = 0; i < files.size(); ++i) {
        std::error_code ec;
        std::filesystem::rename(TempPath(files[i].path), files[i].path, ec);
        if (ec) {
            std::cerr << "[atomic] rename failed for " << files[i].path << ": " << ec.message() << '\n';
            RestoreBackups(files, backed_up, i);
            RemoveTemporaries(files, i, files.size());
            return Fail(error, "Failed to move " + TempPath(files[i].path) + " into place: " + ec.message());
        }
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (backed_up[i]) {
            std::error_code ec;
            std::filesystem::remove(BackupPath(files[i].path), ec);
            if (ec) {
                std::cerr << "[atomic] Could not remove backup " << BackupPath(files[i].path) << ": "
                          << ec.message() << '\n';
            }
        }
    }
    return true;
}

}  // namespace nrating::core::util
