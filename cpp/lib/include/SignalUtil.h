/** \file    SignalUtil.h
 *  \brief   Declarations of utility functions dealing w/ signal handling.
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


#include <set>
#include <csignal>


namespace SignalUtil {


/** \class  SignalBlocker
 *  \brief  Blocks one or more signals for the calling thread, and for all threads it creates afterwards, until an
 *          instance goes out of scope.
 */
class SignalBlocker {
    sigset_t signal_set_;
    bool unblocked_;
public:
    /** \throws std::runtime_error if pthread_sigmask(3) fails. */
    explicit SignalBlocker(const std::set<int> &signal_nos);
    explicit SignalBlocker(const int signal_no): SignalBlocker(std::set<int>{ signal_no }) { }
    SignalBlocker(const SignalBlocker &rhs) = delete;
    ~SignalBlocker() { unblock(); }

    void unblock();
};


typedef void SignalHandler(int);


/** \throws std::runtime_error if sigaction(2) fails. */
void InstallHandler(const int signal_no, SignalHandler handler);


/** \brief  Waits for one of the blocked signals "signal_nos" to become pending and consumes it.
 *  \return The signal number or 0 if "timeout_ms" elapsed first.
 *  \note   The signals must be blocked in every thread, see SignalBlocker.
 */
int WaitForSignal(const std::set<int> &signal_nos, const unsigned timeout_ms);


} // namespace SignalUtil
