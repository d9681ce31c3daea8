/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_FS_HPP_
#define GENIE_FS_HPP_

#include <dirent.h>

#include <cstdint>
#include <string>
#include <vector>

#include "genie/common/tools/error.hpp"

namespace genie::fs {

/**
 * Directory iterator.
 * The iteration order is unspecified, except that each directory entry is visited only once.
 */
class DirIterator {
public:
    /**
     * Directory entry.
     */
    struct Entry {
        std::string mPath;
        bool        mIsDir = false;
    };

    /**
     * Constructor.
     *
     * @param path directory path.
     */
    explicit DirIterator(const std::string& path);

    /**
     * Move constructor.
     *
     * @param other iterator to move from.
     */
    DirIterator(DirIterator&& other);

    /**
     * Move assignment.
     *
     * @param other iterator to move from.
     * @return DirIterator&.
     */
    DirIterator& operator=(DirIterator&& other);

    DirIterator(const DirIterator&)            = delete;
    DirIterator& operator=(const DirIterator&) = delete;

    /**
     * Destructor.
     */
    ~DirIterator();

    /**
     * Checks if directory was opened.
     *
     * @return bool.
     */
    bool IsValid() const { return mDir != nullptr; }

    /**
     * Moves to the next entry. The special pathnames dot and dot-dot are skipped.
     *
     * @return bool.
     */
    bool Next();

    /**
     * Returns root path.
     *
     * @return const std::string&.
     */
    const std::string& GetRootPath() const { return mRoot; }

    /**
     * Returns current entry reference.
     *
     * @return const Entry&.
     */
    const Entry& operator*() const { return mEntry; }

    /**
     * Returns current entry pointer.
     *
     * @return const Entry*.
     */
    const Entry* operator->() const { return &mEntry; }

private:
    DIR*        mDir = nullptr;
    Entry       mEntry;
    std::string mRoot;
};

/**
 * Appends path to string.
 */
template <typename... Args>
std::string& AppendPath(std::string& path, const Args&... args)
{
    auto AppendPathEntry = [](std::string& path, const std::string& item) -> std::string& {
        if (path.empty() || path.back() == '/') {
            path.append(item);
        } else {
            path.append("/").append(item);
        }

        return path;
    };

    (AppendPathEntry(path, args), ...);

    return path;
}

/**
 * Joins path items.
 */
template <typename... Args>
std::string JoinPath(const Args&... args)
{
    std::string path;

    AppendPath(path, args...);

    return path;
}

/**
 * Checks if directory exists.
 *
 * @param path directory path.
 * @return RetWithError<bool>.
 */
RetWithError<bool> DirExist(const std::string& path);

/**
 * Checks if path is a regular file executable by the current user.
 *
 * @param path file path.
 * @return bool.
 */
bool IsExecutable(const std::string& path);

/**
 * Returns sorted names of directory entries which are not directories.
 *
 * @param path directory path.
 * @param[out] names file names.
 * @return Error.
 */
Error ListFiles(const std::string& path, std::vector<std::string>& names);

/**
 * Reads content of the file named by fileName into the given string.
 *
 * @param fileName file name.
 * @param[out] text result string.
 * @return Error.
 */
Error ReadFileToString(const std::string& fileName, std::string& text);

/**
 * Creates new file with a specified text. Fails with eAlreadyExist if the file exists.
 *
 * @param fileName file name.
 * @param text input text.
 * @param perm permissions.
 * @return Error.
 */
Error CreateFileExclusive(const std::string& fileName, const std::string& text, uint32_t perm);

} // namespace genie::fs

#endif
