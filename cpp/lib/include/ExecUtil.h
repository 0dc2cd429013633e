/** \file    ExecUtil.h
 *  \brief   Helpers for running child processes.
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


#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <signal.h>
#include <sys/types.h>


namespace ExecUtil {


/** \brief  Search the PATH for "executable_candidate".
 *  \return The full path to the executable or the empty string if it couldn't be found.
 *  \note   If "executable_candidate" contains a slash it is checked directly.
 */
std::string Which(const std::string &executable_candidate);


/** \class  PipedChild
 *  \brief  A child process whose stdin or stdout is connected to us through a pipe.
 *  \note   The child runs in its own session so that kill() reaches all of its descendants.  If an instance goes out of
 *          scope while the child is still running, the child is killed and reaped.
 */
class PipedChild {
public:
    enum Direction { READ_FROM_CHILD, WRITE_TO_CHILD };
private:
    Direction direction_;
    std::string command_;
    mutable std::mutex mutex_;
    pid_t pid_;
    int pipe_fd_;
    bool reaped_;
    int exit_status_;
public:
    /** \brief  Starts "command" w/ "args".
     *  \param  envs  Additional environment variables for the child.
     *  \throws std::runtime_error if "command" is not executable or we failed to fork.
     */
    PipedChild(const std::string &command, const std::vector<std::string> &args, const Direction direction,
               const std::unordered_map<std::string, std::string> &envs = {});
    PipedChild(const PipedChild &rhs) = delete;
    ~PipedChild();

    /** \return The number of bytes read, 0 at end-of-file or -1 on error w/ errno set. */
    ssize_t read(char * const buffer, const size_t buffer_size);

    /** \return False if the child stopped reading, e.g. because it died, w/ errno set. */
    bool write(const char * const data, const size_t data_size);

    /** Closes our end of the pipe, typically to signal end-of-input to the child. */
    void closePipe();

    /** \brief  Closes our end of the pipe if still open and waits for the child to terminate.
     *  \return The exit code of the child or 128 plus the signal number if it was killed by a signal.
     */
    int wait();

    /** Sends "signal_no" to the child's process group unless the child has already been reaped. */
    void kill(const int signal_no = SIGTERM);
};


/** \brief  Runs "command" to completion w/ stdin, stdout and stderr redirected to /dev/null.
 *  \return The exit code, or 128 plus the signal number if the command was killed by a signal.
 */
int Exec(const std::string &command, const std::vector<std::string> &args = {},
         const std::unordered_map<std::string, std::string> &envs = {});


} // namespace ExecUtil
