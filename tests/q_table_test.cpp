#include <gtest/gtest.h>

#include <vector>
#include "../src_headless/common/q_table.hpp"

namespace {

State make_state(double first) {
    State s;
    s.values[0] = first;
    return s;
}

}  // namespace

TEST(QTable, RowIsCreatedAsZerosOnFirstAccess) {
    QTable q;
    State s = make_state(2);
    EXPECT_FALSE(q.contains(s));

    std::vector<double>& row = q.row(s);
    EXPECT_EQ(row, std::vector<double>(N_ACTIONS, 0.0));
    EXPECT_TRUE(q.contains(s));
    EXPECT_EQ(q.size(), 1u);

    row[3] = 1.5;
    EXPECT_EQ(q.row(s)[3], 1.5);
    EXPECT_EQ(q.size(), 1u);
}

TEST(QTable, ReadOnlyLookupDoesNotInsert) {
    QTable q;
    State s = make_state(4);
    EXPECT_EQ(q.values(s), std::vector<double>(N_ACTIONS, 0.0));
    EXPECT_EQ(q.best_value(s), 0.0);
    EXPECT_FALSE(q.contains(s));
    EXPECT_EQ(q.size(), 0u);
}

TEST(QTable, BestValueIsRowMaximum) {
    QTable q;
    State s = make_state(1);
    std::vector<double>& row = q.row(s);
    row[0] = -3.0;
    row[5] = 2.25;
    row[7] = 1.0;
    EXPECT_EQ(q.best_value(s), 2.25);
}

TEST(QTable, StatesAreKeyedByExactValue) {
    QTable q;
    q.row(make_state(1))[0] = 1.0;
    q.row(make_state(1.0000001))[0] = 2.0;

    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.values(make_state(1))[0], 1.0);
    EXPECT_EQ(q.values(make_state(1.0000001))[0], 2.0);

    int rows = 0;
    for (const auto& entry : q) {
        EXPECT_EQ(entry.second.size(), (size_t)N_ACTIONS);
        rows++;
    }
    EXPECT_EQ(rows, 2);
}
