/** \file    ExecUtil.cc
 *  \brief   Implementation of child process helpers.
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
#include "ExecUtil.h"
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


extern char **environ;


namespace {


const int EXECVE_FAILURE(248);


bool IsExecutableFile(const std::string &path) {
    struct stat statbuf;
    return ::stat(path.c_str(), &statbuf) == 0 and S_ISREG(statbuf.st_mode) and ::access(path.c_str(), X_OK) == 0;
}


// Owns the argv and envp arrays for execve(2).  Everything is allocated before we fork because only
// async-signal-safe functions may be called in the child of a multithreaded parent.
class ExecArguments {
    std::vector<std::string> strings_;
    std::vector<char *> argv_, envp_;
public:
    ExecArguments(const std::string &command, const std::vector<std::string> &args,
                  const std::unordered_map<std::string, std::string> &envs);
    char * const *getArgv() { return argv_.data(); }
    char * const *getEnvp() { return envp_.data(); }
};


ExecArguments::ExecArguments(const std::string &command, const std::vector<std::string> &args,
                             const std::unordered_map<std::string, std::string> &envs)
{
    strings_.emplace_back(command);
    strings_.insert(strings_.end(), args.cbegin(), args.cend());
    const size_t argc(strings_.size());

    for (char **env(environ); env != nullptr and *env != nullptr; ++env) {
        const std::string name_and_value(*env);
        const std::string name(name_and_value.substr(0, name_and_value.find('=')));
        if (envs.find(name) == envs.cend())
            strings_.emplace_back(name_and_value);
    }
    for (const auto &name_and_value : envs)
        strings_.emplace_back(name_and_value.first + "=" + name_and_value.second);

    for (size_t i(0); i < strings_.size(); ++i)
        (i < argc ? argv_ : envp_).emplace_back(const_cast<char *>(strings_[i].c_str()));
    argv_.emplace_back(nullptr);
    envp_.emplace_back(nullptr);
}


int DecodeExitStatus(const std::string &command, const int child_exit_status) {
    if (WIFEXITED(child_exit_status)) {
        if (unlikely(WEXITSTATUS(child_exit_status) == EXECVE_FAILURE))
            LOG_WARNING("failed to execve(2) \"" + command + "\" in the child!");
        return WEXITSTATUS(child_exit_status);
    }
    if (WIFSIGNALED(child_exit_status))
        return 128 + WTERMSIG(child_exit_status);

    throw std::runtime_error("in ExecUtil::DecodeExitStatus: dazed and confused!");
}


int WaitForChild(const pid_t pid) {
    int child_exit_status;
    while (::waitpid(pid, &child_exit_status, 0) == -1) {
        if (errno != EINTR)
            throw std::runtime_error("in ExecUtil::WaitForChild: waitpid(2) failed: " + std::string(std::strerror(errno)));
    }

    return child_exit_status;
}


// Child side of the fork.  Never returns.
[[noreturn]] void ExecInChild(const std::string &command, ExecArguments * const exec_arguments, const int new_stdin_fd,
                              const int new_stdout_fd, const int new_stderr_fd)
{
    // Make us the leader of a new process group:
    if (::setsid() == static_cast<pid_t>(-1))
        ::_exit(EXECVE_FAILURE);

    if ((new_stdin_fd != -1 and ::dup2(new_stdin_fd, STDIN_FILENO) == -1)
        or (new_stdout_fd != -1 and ::dup2(new_stdout_fd, STDOUT_FILENO) == -1)
        or (new_stderr_fd != -1 and ::dup2(new_stderr_fd, STDERR_FILENO) == -1))
        ::_exit(EXECVE_FAILURE);

    ::signal(SIGPIPE, SIG_DFL);
    ::execve(command.c_str(), exec_arguments->getArgv(), exec_arguments->getEnvp());
    ::_exit(EXECVE_FAILURE); // We typically never get here.
}


} // unnamed namespace


namespace ExecUtil {


std::string Which(const std::string &executable_candidate) {
    if (executable_candidate.find('/') != std::string::npos)
        return IsExecutableFile(executable_candidate) ? executable_candidate : "";

    const char * const PATH(::getenv("PATH"));
    if (PATH == nullptr)
        return "";

    std::vector<std::string> path_components;
    StringUtil::Split(PATH, ':', &path_components, /* suppress_empty_components = */ true);
    for (const auto &path_component : path_components) {
        const std::string full_path(path_component + "/" + executable_candidate);
        if (IsExecutableFile(full_path))
            return full_path;
    }

    return "";
}


PipedChild::PipedChild(const std::string &command, const std::vector<std::string> &args, const Direction direction,
                       const std::unordered_map<std::string, std::string> &envs)
    : direction_(direction), command_(command), pid_(-1), pipe_fd_(-1), reaped_(false), exit_status_(0)
{
    if (unlikely(not IsExecutableFile(command_)))
        throw std::runtime_error("in ExecUtil::PipedChild::PipedChild: can't execute \"" + command_ + "\"!");

    ExecArguments exec_arguments(command_, args, envs);

    int pipe_fds[2];
    if (unlikely(::pipe2(pipe_fds, O_CLOEXEC) == -1))
        throw std::runtime_error("in ExecUtil::PipedChild::PipedChild: pipe2(2) failed: " + std::string(std::strerror(errno)));

    pid_ = ::fork();
    if (pid_ == -1) {
        const int saved_errno(errno);
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        throw std::runtime_error("in ExecUtil::PipedChild::PipedChild: fork(2) failed: " + std::string(std::strerror(saved_errno)));
    }

    if (pid_ == 0) {
        if (direction_ == READ_FROM_CHILD)
            ExecInChild(command_, &exec_arguments, -1, pipe_fds[1], -1);
        else
            ExecInChild(command_, &exec_arguments, pipe_fds[0], -1, -1);
    }

    // The parent of the fork:
    if (direction_ == READ_FROM_CHILD) {
        ::close(pipe_fds[1]);
        pipe_fd_ = pipe_fds[0];
    } else {
        ::close(pipe_fds[0]);
        pipe_fd_ = pipe_fds[1];
    }
    LOG_DEBUG("started \"" + command_ + "\" as PID " + std::to_string(pid_));
}


PipedChild::~PipedChild() {
    std::unique_lock<std::mutex> mutex_locker(mutex_);
    if (not reaped_) {
        if (::kill(-pid_, SIGKILL) == -1 and errno == ESRCH)
            ::kill(pid_, SIGKILL);
        mutex_locker.unlock();
        try {
            wait();
        } catch (const std::runtime_error &x) {
            LOG_WARNING("failed to reap \"" + command_ + "\": " + std::string(x.what()));
        }
    } else if (pipe_fd_ != -1)
        ::close(pipe_fd_);
}


ssize_t PipedChild::read(char * const buffer, const size_t buffer_size) {
    if (unlikely(direction_ != READ_FROM_CHILD or pipe_fd_ == -1)) {
        errno = EBADF;
        return -1;
    }

    ssize_t bytes_read;
    while ((bytes_read = ::read(pipe_fd_, buffer, buffer_size)) == -1 and errno == EINTR)
        /* Intentionally empty! */;

    return bytes_read;
}


bool PipedChild::write(const char * const data, const size_t data_size) {
    if (unlikely(direction_ != WRITE_TO_CHILD or pipe_fd_ == -1)) {
        errno = EBADF;
        return false;
    }

    const char *cp(data);
    size_t remaining(data_size);
    while (remaining > 0) {
        const ssize_t written(::write(pipe_fd_, cp, remaining));
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


void PipedChild::closePipe() {
    if (pipe_fd_ != -1) {
        ::close(pipe_fd_);
        pipe_fd_ = -1;
    }
}


int PipedChild::wait() {
    closePipe();

    // Wait w/o reaping so that kill() can't hit a recycled PID and doesn't block while we wait.
    siginfo_t info;
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1) {
        if (errno == ECHILD)
            break; // Already reaped by a concurrent wait().
        if (errno != EINTR)
            throw std::runtime_error("in ExecUtil::PipedChild::wait: waitid(2) failed: " + std::string(std::strerror(errno)));
    }

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (not reaped_) {
        exit_status_ = DecodeExitStatus(command_, WaitForChild(pid_));
        reaped_ = true;
    }

    return exit_status_;
}


void PipedChild::kill(const int signal_no) {
    // Holding the mutex guarantees that the PID has not been reaped and possibly reused.
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (not reaped_ and ::kill(-pid_, signal_no) == -1 and errno == ESRCH)
        ::kill(pid_, signal_no); // The child may not have called setsid(2) yet.
}


int Exec(const std::string &command, const std::vector<std::string> &args, const std::unordered_map<std::string, std::string> &envs) {
    if (unlikely(not IsExecutableFile(command)))
        throw std::runtime_error("in ExecUtil::Exec: can't execute \"" + command + "\"!");

    ExecArguments exec_arguments(command, args, envs);
    const int dev_null_fd(::open("/dev/null", O_RDWR | O_CLOEXEC));
    if (unlikely(dev_null_fd == -1))
        throw std::runtime_error("in ExecUtil::Exec: can't open /dev/null!");

    const pid_t pid(::fork());
    if (pid == -1) {
        ::close(dev_null_fd);
        throw std::runtime_error("in ExecUtil::Exec: fork(2) failed: " + std::string(std::strerror(errno)));
    }
    if (pid == 0)
        ExecInChild(command, &exec_arguments, dev_null_fd, dev_null_fd, dev_null_fd);

    ::close(dev_null_fd);
    return DecodeExitStatus(command, WaitForChild(pid));
}


} // namespace ExecUtil
