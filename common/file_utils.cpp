#include "common/file_utils.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Common {

Status readTextFile(const std::string& path, std::string& out) {
    FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return Status::error(ErrorKind::IO_FAILURE, "Failed to read %s: %s", path.c_str(), std::strerror(errno));
    }

    std::string content;
    char chunk[8192];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
        content.append(chunk, n);
    }
    const int read_errno = errno;
    const bool failed = std::ferror(file) != 0;
    std::fclose(file);
    if (failed) {
        return Status::error(ErrorKind::IO_FAILURE, "Failed to read %s: %s", path.c_str(), std::strerror(read_errno));
    }
    out = std::move(content);
    return Status::ok();
}

Status writeTextFile(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return Status::error(ErrorKind::IO_FAILURE, "Cannot open %s for writing: %s", path.c_str(), std::strerror(errno));
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int write_errno = errno;
            close(fd);
            return Status::error(ErrorKind::IO_FAILURE, "Write to %s failed: %s", path.c_str(), std::strerror(write_errno));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        return Status::error(ErrorKind::IO_FAILURE, "Close of %s failed: %s", path.c_str(), std::strerror(errno));
    }
    return Status::ok();
}

Status createDirectories(const std::string& path) {
    if (path.empty()) {
        return Status::error(ErrorKind::INVALID_ARGUMENT, "Empty directory path");
    }

    struct stat st{};
    if (stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return Status::ok();
        }
        return Status::error(ErrorKind::IO_FAILURE, "Path exists but is not a directory: %s", path.c_str());
    }

    std::string temp = path;
    for (size_t i = 1; i < temp.size(); ++i) {
        if (temp[i] != '/') continue;
        temp[i] = '\0';
        if (mkdir(temp.c_str(), 0755) != 0 && errno != EEXIST) {
            return Status::error(ErrorKind::IO_FAILURE, "Failed to create directory %s: %s",
                                 temp.c_str(), std::strerror(errno));
        }
        temp[i] = '/';
    }

    if (mkdir(temp.c_str(), 0755) != 0 && errno != EEXIST) {
        return Status::error(ErrorKind::IO_FAILURE, "Failed to create directory %s: %s",
                             temp.c_str(), std::strerror(errno));
    }
    return Status::ok();
}

} // namespace Common
