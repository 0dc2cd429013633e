/** \brief Test cases for running child processes
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
#include <stdexcept>
#include <string>
#include <vector>
#include <csignal>
#include "ExecUtil.h"
#include "UnitTest.h"


namespace {


std::string ReadAll(ExecUtil::PipedChild * const child) {
    std::string output;
    char buffer[1024];
    ssize_t bytes_read;
    while ((bytes_read = child->read(buffer, sizeof buffer)) > 0)
        output.append(buffer, static_cast<size_t>(bytes_read));
    return output;
}


} // unnamed namespace


TEST(Which) {
    CHECK_EQ(ExecUtil::Which("/bin/sh"), "/bin/sh");
    CHECK_FALSE(ExecUtil::Which("sh").empty());
    CHECK_TRUE(ExecUtil::Which("no-such-command-hopefully").empty());
}


TEST(Exec) {
    CHECK_EQ(ExecUtil::Exec("/bin/sh", { "-c", "exit 0" }), 0);
    CHECK_EQ(ExecUtil::Exec("/bin/sh", { "-c", "exit 3" }), 3);
    CHECK_EQ(ExecUtil::Exec("/bin/sh", { "-c", "kill -TERM $$" }), 128 + SIGTERM);
    CHECK_EQ(ExecUtil::Exec("/bin/sh", { "-c", "test \"$DUMPBRIDGE_TEST\" = yes" }, { { "DUMPBRIDGE_TEST", "yes" } }), 0);
    CHECK_THROW(ExecUtil::Exec("/no/such/command"), std::runtime_error);
}


TEST(ReadFromChild) {
    ExecUtil::PipedChild child("/bin/sh", { "-c", "printf 'line 1\\nline 2\\n'; exit 5" }, ExecUtil::PipedChild::READ_FROM_CHILD);
    CHECK_EQ(ReadAll(&child), "line 1\nline 2\n");
    CHECK_EQ(child.wait(), 5);
    CHECK_EQ(child.wait(), 5);
}


TEST(WriteToChild) {
    ExecUtil::PipedChild child("/bin/sh", { "-c", "test \"$(cat)\" = 'hello world'" }, ExecUtil::PipedChild::WRITE_TO_CHILD);
    CHECK_TRUE(child.write("hello ", 6));
    CHECK_TRUE(child.write("world", 5));
    child.closePipe();
    CHECK_EQ(child.wait(), 0);
}


TEST(WritingToADeadChildFails) {
    ::signal(SIGPIPE, SIG_IGN);
    ExecUtil::PipedChild child("/bin/sh", { "-c", "exit 1" }, ExecUtil::PipedChild::WRITE_TO_CHILD);
    const std::string data(1024 * 1024, 'x');
    bool write_succeeded(true);
    for (unsigned i(0); i < 16 and write_succeeded; ++i)
        write_succeeded = child.write(data.data(), data.size());
    CHECK_FALSE(write_succeeded);
    CHECK_EQ(child.wait(), 1);
}


TEST(KillReachesTheWholeProcessGroup) {
    ExecUtil::PipedChild child("/bin/sh", { "-c", "echo started; sleep 60 & sleep 60; echo never" },
                               ExecUtil::PipedChild::READ_FROM_CHILD);
    char buffer[8];
    CHECK_EQ(child.read(buffer, sizeof buffer), 8);
    CHECK_EQ(std::string(buffer, sizeof buffer), "started\n");
    child.kill();
    // Only EOF, no "never", and no background sleep keeping the pipe open:
    CHECK_EQ(ReadAll(&child), "");
    CHECK_EQ(child.wait(), 128 + SIGTERM);
    child.kill();
}


TEST_MAIN(ExecUtil)
