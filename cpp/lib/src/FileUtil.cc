/** \file   FileUtil.cc
 *  \brief  Implementation of file-system related utility functions.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "FileUtil.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix, const bool remove_when_out_of_scope)
    : remove_when_out_of_scope_(remove_when_out_of_scope)
{
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(const_cast<char *>(path_template.c_str())));
    if (path == nullptr)
        throw std::runtime_error("in FileUtil::AutoTempDirectory::AutoTempDirectory: mkdtemp(3) for path prefix \"" + path_prefix
                                 + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        throw std::runtime_error("in FileUtil::AutoTempDirectory::AutoTempDirectory: realpath(3) for path \"" + std::string(path)
                                 + "\" failed!");
    path_ = resolved_path;
}


AutoTempDirectory::~AutoTempDirectory() {
    if (remove_when_out_of_scope_ and not RemoveDirectory(path_))
        LOG_WARNING("can't remove \"" + path_ + "\"!");
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    output.close();
    return not output.fail();
}


namespace {


// Makes a completed rename(2) durable.
void FsyncDirectory(const std::string &directory) {
    const int dir_fd(::open(directory.empty() ? "." : directory.c_str(), O_RDONLY | O_DIRECTORY));
    if (dir_fd == -1)
        return;
    ::fsync(dir_fd);
    ::close(dir_fd);
}


} // unnamed namespace


AtomicFileWriter::AtomicFileWriter(const std::string &path): path_(path), fd_(-1) {
    const std::string directory(GetDirname(path_));
    temp_path_ = (directory.empty() ? std::string(".") : directory) + "/.tmp-XXXXXX";
    fd_ = ::mkstemp(const_cast<char *>(temp_path_.c_str()));
    if (unlikely(fd_ == -1))
        throw std::runtime_error("in FileUtil::AtomicFileWriter::AtomicFileWriter: can't create a temporary file for \"" + path_
                                 + "\"! (" + std::string(std::strerror(errno)) + ")");
}


bool AtomicFileWriter::write(const char * const data, const size_t data_size) {
    if (unlikely(fd_ == -1)) {
        errno = EBADF;
        return false;
    }

    const char *cp(data);
    size_t remaining(data_size);
    while (remaining > 0) {
        const ssize_t written(::write(fd_, cp, remaining));
        if (written == -1) {
            if (errno == EINTR)
                continue;
            return false;
        }
        cp += written;
        remaining -= static_cast<size_t>(written);
    }

    return true;
}


bool AtomicFileWriter::commit() {
    if (unlikely(fd_ == -1)) {
        errno = EBADF;
        return false;
    }

    const int fd(fd_);
    fd_ = -1;
    const bool synced(::fsync(fd) == 0);
    int saved_errno(errno);
    const bool closed(::close(fd) == 0);
    if (synced and not closed)
        saved_errno = errno;
    if (not synced or not closed or ::rename(temp_path_.c_str(), path_.c_str()) != 0) {
        if (synced and closed)
            saved_errno = errno;
        ::unlink(temp_path_.c_str());
        errno = saved_errno;
        return false;
    }

    FsyncDirectory(GetDirname(path_));
    return true;
}


void AtomicFileWriter::discard() {
    if (fd_ == -1)
        return;

    ::close(fd_);
    fd_ = -1;
    ::unlink(temp_path_.c_str());
}


bool WriteStringAtomically(const std::string &path, const std::string &data) {
    try {
        AtomicFileWriter writer(path);
        return writer.write(data) and writer.commit();
    } catch (const std::runtime_error &x) {
        LOG_DEBUG(x.what());
        return false;
    }
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (input.fail())
        return false;

    const off_t file_size(GetFileSize(path));
    if (file_size < 0)
        return false;

    data->resize(static_cast<size_t>(file_size));
    input.read(&(*data)[0], file_size);
    return not input.bad() and input.gcount() == file_size;
}


std::string ReadStringOrThrow(const std::string &path) {
    std::string data;
    if (unlikely(not ReadString(path, &data)))
        throw std::runtime_error("in FileUtil::ReadStringOrThrow: failed to read \"" + path + "\"!");

    return data;
}


bool Exists(const std::string &path) {
    return ::access(path.c_str(), F_OK) == 0;
}


bool IsDirectory(const std::string &dir_name) {
    struct stat statbuf;
    if (::stat(dir_name.c_str(), &statbuf) != 0)
        return false;

    return S_ISDIR(statbuf.st_mode);
}


off_t GetFileSize(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        return -1;

    return stat_buf.st_size;
}


bool MakeDirectory(const std::string &path, const bool recursive, const mode_t mode) {
    const bool absolute(path[0] == '/');
    // In NON-recursive mode we make a single attempt to create the directory:
    if (not recursive) {
        errno = 0;
        if (::mkdir(path.c_str(), mode) == 0)
            return true;
        const bool dir_exists(errno == EEXIST and IsDirectory(path));
        if (dir_exists)
            errno = 0;
        return dir_exists;
    }

    std::vector<std::string> path_components;
    StringUtil::Split(path, '/', &path_components, /* suppress_empty_components = */ true);

    std::string path_so_far;
    if (absolute)
        path_so_far += "/";
    for (const auto &path_component : path_components) {
        path_so_far += path_component;
        path_so_far += '/';
        errno = 0;
        if (::mkdir(path_so_far.c_str(), mode) == -1 and errno != EEXIST)
            return false;
        if (errno == EEXIST and not IsDirectory(path_so_far))
            return false;
    }
    errno = 0;

    return true;
}


bool RemoveDirectory(const std::string &dir_name) {
    DIR *dir_handle(::opendir(dir_name.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    bool success(true);
    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;

        const std::string path(dir_name + "/" + std::string(entry->d_name));
        if (IsDirectory(path)) {
            if (unlikely(not RemoveDirectory(path)))
                success = false;
        } else if (unlikely(::unlink(path.c_str()) != 0))
            success = false;
    }
    ::closedir(dir_handle);

    return success and ::rmdir(dir_name.c_str()) == 0;
}


bool RenameFile(const std::string &old_name, const std::string &new_name) {
    return ::rename(old_name.c_str(), new_name.c_str()) == 0;
}


bool DeleteFile(const std::string &path) {
    return ::unlink(path.c_str()) == 0;
}


static bool CollectRegularFiles(const std::string &base_directory, const std::string &relative_directory,
                                std::vector<std::string> * const relative_paths)
{
    const std::string directory(relative_directory.empty() ? base_directory : base_directory + "/" + relative_directory);
    DIR *dir_handle(::opendir(directory.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    std::vector<std::string> subdirectories;
    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (entry->d_name[0] == '.') // Also skips our own in-progress temporary files.
            continue;

        const std::string relative_path(relative_directory.empty() ? std::string(entry->d_name)
                                                                   : relative_directory + "/" + entry->d_name);
        if (IsDirectory(base_directory + "/" + relative_path))
            subdirectories.emplace_back(relative_path);
        else
            relative_paths->emplace_back(relative_path);
    }
    ::closedir(dir_handle);

    for (const auto &subdirectory : subdirectories) {
        if (not CollectRegularFiles(base_directory, subdirectory, relative_paths))
            return false;
    }

    return true;
}


bool GetRegularFilesRecursively(const std::string &directory, std::vector<std::string> * const relative_paths) {
    relative_paths->clear();
    if (not CollectRegularFiles(directory, "", relative_paths))
        return false;

    std::sort(relative_paths->begin(), relative_paths->end());
    return true;
}


std::string GetDirname(const std::string &path) {
    const std::string::size_type last_slash_pos(path.rfind('/'));
    return (last_slash_pos == std::string::npos) ? "" : path.substr(0, last_slash_pos);
}


} // namespace FileUtil
