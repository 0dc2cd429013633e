/** \brief Test cases for the SharedBuffer class template
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
#include <string>
#include <thread>
#include <vector>
#include "SharedBuffer.h"
#include "UnitTest.h"


TEST(ProducerAndConsumer) {
    SharedBuffer<unsigned> buffer(2);
    std::thread producer([&buffer]() {
        for (unsigned i(0); i < 1000; ++i)
            buffer.push_back(i);
        buffer.close();
    });

    std::vector<unsigned> consumed;
    unsigned item;
    while (buffer.pop_front(&item)) {
        CHECK_LE(buffer.size(), buffer.capacity());
        consumed.emplace_back(item);
    }
    producer.join();

    CHECK_EQ(consumed.size(), 1000u);
    bool in_order(true);
    for (unsigned i(0); i < consumed.size(); ++i)
        in_order = in_order and consumed[i] == i;
    CHECK_TRUE(in_order);
}


TEST(CloseLetsTheConsumerDrain) {
    SharedBuffer<std::string> buffer(4);
    CHECK_TRUE(buffer.push_back("a"));
    CHECK_TRUE(buffer.push_back("b"));
    buffer.close();
    CHECK_FALSE(buffer.push_back("c"));

    std::string item;
    CHECK_TRUE(buffer.pop_front(&item));
    CHECK_EQ(item, "a");
    CHECK_TRUE(buffer.pop_front(&item));
    CHECK_EQ(item, "b");
    CHECK_FALSE(buffer.pop_front(&item));
    CHECK_TRUE(buffer.empty());
}


TEST(AbortDiscardsAndWakesUpEverybody) {
    SharedBuffer<std::string> buffer(1);
    CHECK_TRUE(buffer.push_back("a"));

    bool push_result(true);
    std::thread blocked_producer([&buffer, &push_result]() { push_result = buffer.push_back("b"); });
    buffer.abort();
    blocked_producer.join();
    CHECK_FALSE(push_result);

    std::string item;
    CHECK_FALSE(buffer.pop_front(&item));
    CHECK_TRUE(buffer.empty());
}


TEST(ZeroCapacityMeansOne) {
    SharedBuffer<int> buffer(0);
    CHECK_EQ(buffer.capacity(), 1u);
}


TEST_MAIN(SharedBuffer)
