/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "genie/common/tools/fs.hpp"

namespace genie::fs {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

Error WriteAll(int fd, const std::string& text)
{
    size_t pos = 0;

    while (pos < text.size()) {
        auto chunkSize = write(fd, text.data() + pos, text.size() - pos);
        if (chunkSize < 0) {
            if (errno == EINTR) {
                continue;
            }

            return Error(errno);
        }

        pos += chunkSize;
    }

    return ErrorEnum::eNone;
}

} // namespace

/***********************************************************************************************************************
 * DirIterator implementation
 **********************************************************************************************************************/

DirIterator::DirIterator(const std::string& path)
    : mDir(opendir(path.c_str()))
    , mRoot(path)
{
}

DirIterator::DirIterator(DirIterator&& other)
    : mDir(other.mDir)
    , mEntry(std::move(other.mEntry))
    , mRoot(std::move(other.mRoot))
{
    other.mDir = nullptr;
}

DirIterator& DirIterator::operator=(DirIterator&& other)
{
    if (this != &other) {
        if (mDir) {
            closedir(mDir);
        }

        mDir   = other.mDir;
        mEntry = std::move(other.mEntry);
        mRoot  = std::move(other.mRoot);

        other.mDir = nullptr;
    }

    return *this;
}

DirIterator::~DirIterator()
{
    if (mDir) {
        closedir(mDir);
    }
}

bool DirIterator::Next()
{
    if (mDir == nullptr) {
        return false;
    }

    struct dirent* entry = nullptr;

    while ((entry = readdir(mDir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }

        auto        path = JoinPath(mRoot, entry->d_name);
        struct stat entryStat;

        // Entry may disappear between readdir and stat (e.g. dangling symlink), skip it.
        if (stat(path.c_str(), &entryStat) == -1) {
            continue;
        }

        mEntry.mPath  = entry->d_name;
        mEntry.mIsDir = S_ISDIR(entryStat.st_mode);

        return true;
    }

    return false;
}

/***********************************************************************************************************************
 * fs functions implementation
 **********************************************************************************************************************/

RetWithError<bool> DirExist(const std::string& path)
{
    auto dir = opendir(path.c_str());
    if (dir == nullptr) {
        if (errno == ENOENT) {
            return false;
        }

        return {false, Error(errno)};
    }

    closedir(dir);

    return true;
}

bool IsExecutable(const std::string& path)
{
    struct stat s;

    if (stat(path.c_str(), &s) != 0) {
        return false;
    }

    return S_ISREG(s.st_mode) && access(path.c_str(), X_OK) == 0;
}

Error ListFiles(const std::string& path, std::vector<std::string>& names)
{
    DirIterator it(path);

    if (!it.IsValid()) {
        return Error(errno);
    }

    while (it.Next()) {
        if (!it->mIsDir) {
            names.push_back(it->mPath);
        }
    }

    std::sort(names.begin(), names.end());

    return ErrorEnum::eNone;
}

Error ReadFileToString(const std::string& fileName, std::string& text)
{
    auto fd = open(fileName.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error(errno);
    }

    text.clear();

    char buffer[4096];

    while (true) {
        auto count = read(fd, buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }

            auto err = Error(errno);

            close(fd);

            return err;
        }

        if (count == 0) {
            break;
        }

        text.append(buffer, count);
    }

    if (close(fd) != 0) {
        return Error(errno);
    }

    return ErrorEnum::eNone;
}

Error CreateFileExclusive(const std::string& fileName, const std::string& text, uint32_t perm)
{
    auto fd = open(fileName.c_str(), O_CREAT | O_EXCL | O_WRONLY, perm);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Error(ErrorEnum::eAlreadyExist, "file already exists");
        }

        return Error(errno);
    }

    if (auto err = WriteAll(fd, text); !err.IsNone()) {
        close(fd);
        unlink(fileName.c_str());

        return err;
    }

    if (close(fd) != 0) {
        return Error(errno);
    }

    // umask may drop requested bits on create
    if (chmod(fileName.c_str(), perm) != 0) {
        return Error(errno);
    }

    return ErrorEnum::eNone;
}

} // namespace genie::fs
