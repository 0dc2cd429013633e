/** \file    SignalUtil.cc
 *  \brief   Implementation of signal handling utility functions.
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
#include "SignalUtil.h"
#include <stdexcept>
#include <string>
#include <cerrno>
#include <cstring>
#include <pthread.h>
#include "util.h"


namespace SignalUtil {


SignalBlocker::SignalBlocker(const std::set<int> &signal_nos): unblocked_(false) {
    sigemptyset(&signal_set_);
    for (const int signal_no : signal_nos)
        sigaddset(&signal_set_, signal_no);
    const int error_code(::pthread_sigmask(SIG_BLOCK, &signal_set_, nullptr));
    if (unlikely(error_code != 0))
        throw std::runtime_error("in SignalUtil::SignalBlocker::SignalBlocker: pthread_sigmask(3) failed: "
                                 + std::string(std::strerror(error_code)));
}


void SignalBlocker::unblock() {
    if (unblocked_)
        return;

    const int error_code(::pthread_sigmask(SIG_UNBLOCK, &signal_set_, nullptr));
    if (unlikely(error_code != 0))
        LOG_WARNING("pthread_sigmask(3) failed: " + std::string(std::strerror(error_code)));
    unblocked_ = true;
}


void InstallHandler(const int signal_no, SignalHandler handler) {
    struct sigaction new_action;
    new_action.sa_handler = handler;
    sigemptyset(&new_action.sa_mask);
    sigaddset(&new_action.sa_mask, signal_no);
    new_action.sa_flags = 0;
    if (unlikely(::sigaction(signal_no, &new_action, nullptr) != 0))
        throw std::runtime_error("in SignalUtil::InstallHandler: sigaction(2) failed for signal " + std::to_string(signal_no) + "!");
}


int WaitForSignal(const std::set<int> &signal_nos, const unsigned timeout_ms) {
    sigset_t signal_set;
    sigemptyset(&signal_set);
    for (const int signal_no : signal_nos)
        sigaddset(&signal_set, signal_no);

    struct timespec timeout;
    timeout.tv_sec  = timeout_ms / 1000;
    timeout.tv_nsec = static_cast<long>(timeout_ms % 1000) * 1000000L;
    for (;;) {
        const int signal_no(::sigtimedwait(&signal_set, nullptr, &timeout));
        if (signal_no > 0)
            return signal_no;
        if (errno == EAGAIN)
            return 0;
        if (unlikely(errno != EINTR))
            throw std::runtime_error("in SignalUtil::WaitForSignal: sigtimedwait(2) failed: " + std::string(std::strerror(errno)));
    }
}


} // namespace SignalUtil
