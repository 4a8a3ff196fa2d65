#include "queue_layout.hpp"
#include <format>
#include <system_error>

std::string directoryName(QueueDirectory dir) {
    switch (dir) {
    case QueueDirectory::Inbox:
        return "Inbox";
    case QueueDirectory::Outbox:
        return "Outbox";
    case QueueDirectory::Sent:
        return "Sent";
    case QueueDirectory::Awaiting:
        return "Awaiting";
    }
    return {};
}

fs::path queuePath(const fs::path& root, QueueDirectory dir) {
    return root / directoryName(dir);
}

std::vector<QueueDirectory> findMissingDirectories(const fs::path& root) {
    std::vector<QueueDirectory> missing;
    for (auto dir : requiredDirectories()) {
        std::error_code ec;
        if (!fs::is_directory(queuePath(root, dir), ec)) {
            missing.push_back(dir);
        }
    }
    return missing;
}

std::expected<void, QueueError> checkSetup(const fs::path& root) {
    auto missing = findMissingDirectories(root);
    if (missing.empty()) {
        return {};
    }

    std::string names;
    for (auto dir : missing) {
        if (!names.empty()) {
            names += ", ";
        }
        names += directoryName(dir);
    }
    return std::unexpected(QueueError{ErrorKind::Setup, root.string(),
                                      std::format("missing required directories: {}", names)});
}

std::expected<std::vector<QueueDirectory>, QueueError> runSetup(const fs::path& root) {
    std::vector<QueueDirectory> created;
    for (auto dir : findMissingDirectories(root)) {
        auto path = queuePath(root, dir);
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec) {
            return std::unexpected(QueueError{ErrorKind::Setup, path.string(),
                                              std::format("failed to create directory: {}", ec.message())});
        }
        created.push_back(dir);
    }
    return created;
}

bool isFlatFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::string suffixedName(const std::string& fileName, int counter) {
    auto dot = fileName.rfind('.');
    // A leading dot marks a hidden file, not an extension.
    if (dot == std::string::npos || dot == 0) {
        return std::format("{}_{}", fileName, counter);
    }
    return std::format("{}_{}{}", fileName.substr(0, dot), counter, fileName.substr(dot));
}

fs::path nonConflictingName(const fs::path& dir, const std::string& fileName) {
    fs::path candidate = dir / fileName;
    std::error_code ec;
    for (int counter = 1; fs::exists(fs::symlink_status(candidate, ec)); ++counter) {
        candidate = dir / suffixedName(fileName, counter);
    }
    return candidate;
}
