/** \file   FileUtil.h
 *  \brief  File-system related utility functions.
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
#pragma once


#include <string>
#include <vector>
#include <sys/types.h>


namespace FileUtil {


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and removes it when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool remove_when_out_of_scope_;

public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD", const bool remove_when_out_of_scope = true);
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory();

    const std::string &getDirectoryPath() const { return path_; }
};


bool WriteString(const std::string &path, const std::string &data);


/** \class  AtomicFileWriter
 *  \brief  Collects data in a temporary file next to "path" and only renames it over "path" when commit() is called.
 *  \note   If an instance is destroyed w/o a successful commit(), the temporary file is removed and "path" is left
 *          untouched.
 */
class AtomicFileWriter {
    std::string path_, temp_path_;
    int fd_;
public:
    /** \throws std::runtime_error if the temporary file can't be created. */
    explicit AtomicFileWriter(const std::string &path);
    AtomicFileWriter(const AtomicFileWriter &rhs) = delete;
    ~AtomicFileWriter() { discard(); }

    /** \return True on success, else false w/ errno set. */
    bool write(const char * const data, const size_t data_size);
    inline bool write(const std::string &data) { return write(data.data(), data.size()); }

    /** \brief  fsync(2)s the temporary file and renames it to the final path.
     *  \return True on success, else false w/ errno set, in which case the temporary file has been removed.
     */
    bool commit();

    /** Removes the temporary file unless commit() succeeded. */
    void discard();
};


/** \brief  Writes "data" to a temporary file next to "path", fsync(2)s it and renames it over "path".
 *  \note   Readers either see the old contents of "path" or all of "data", never a partial write.
 *  \return True on success, else false w/ errno set.
 */
bool WriteStringAtomically(const std::string &path, const std::string &data);


bool ReadString(const std::string &path, std::string * const data);

/** \throws std::runtime_error if "path" can't be read. */
std::string ReadStringOrThrow(const std::string &path);


bool Exists(const std::string &path);
bool IsDirectory(const std::string &dir_name);


/** \return The size of "path" in bytes or -1 if it can't be determined. */
off_t GetFileSize(const std::string &path);


/** \brief  Creates a directory.
 *  \param  recursive  If true, creates all missing parent directories as well.
 *  \return True if "path" exists as a directory afterwards, else false.
 */
bool MakeDirectory(const std::string &path, const bool recursive = false, const mode_t mode = 0755);


/** Recursively removes "dir_name" and everything below it. */
bool RemoveDirectory(const std::string &dir_name);


bool RenameFile(const std::string &old_name, const std::string &new_name);
bool DeleteFile(const std::string &path);


/** \brief  Collects the paths of all regular files below "directory", relative to "directory", in sorted order.
 *  \return False if "directory" or one of its subdirectories could not be read.
 */
bool GetRegularFilesRecursively(const std::string &directory, std::vector<std::string> * const relative_paths);


/** \return The part of "path" up to but excluding the last slash or the empty string if there is no slash. */
std::string GetDirname(const std::string &path);


} // namespace FileUtil
