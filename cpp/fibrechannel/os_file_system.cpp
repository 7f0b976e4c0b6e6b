//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "os_file_system.h"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "shared/fc_exceptions.h"

using namespace filesystem;

vector<string> OsFileSystem::ReadDir(const string &dir) const
{
    vector<string> entries;

    error_code error;
    for (directory_iterator it(dir, error); !error && it != directory_iterator(); it.increment(error)) {
        entries.push_back(it->path().filename().string());
    }

    if (error) {
        throw IoException(fmt::format("Can't read directory '{0}': {1}", dir, error.message()));
    }

    // The order of the raw directory listing is undefined
    ranges::sort(entries);

    return entries;
}

bool OsFileSystem::Lstat(const string &file) const
{
    error_code error;
    return exists(symlink_status(file, error));
}

string OsFileSystem::EvalSymlinks(const string &file) const
{
    error_code error;
    const path &p = canonical(file, error);
    if (error) {
        throw IoException(fmt::format("Can't resolve '{0}': {1}", file, error.message()));
    }

    return p.string();
}

void OsFileSystem::WriteFile(const string &file, const string &data, perms permissions) const
{
    const int fd = open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, static_cast<mode_t>(permissions));
    if (fd == -1) {
        throw IoException(fmt::format("Can't open '{0}': {1}", file, strerror(errno)));
    }

    const auto count = write(fd, data.data(), data.size());
    const int write_errno = errno;

    if (close(fd) == -1 && count != -1) {
        throw IoException(fmt::format("Can't write to '{0}': {1}", file, strerror(errno)));
    }

    if (count != static_cast<ssize_t>(data.size())) {
        throw IoException(
            fmt::format("Can't write to '{0}': {1}", file, count == -1 ? strerror(write_errno) : "Short write"));
    }
}
