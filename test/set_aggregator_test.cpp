#include <gtest/gtest.h>
#include <vector>
#include "SetAggregator.h"
#include "fakes.h"

TEST(SetAggregator, unionOfAllOperands) {
    std::vector<ByteArraySet> operands{setOf({"a", "b"}), setOf({}),
                                       setOf({"b", "c"}), setOf({"d"})};
    EXPECT_EQ(SetAggregator::aggregate(SetOperation::Union, operands),
              setOf({"a", "b", "c", "d"}));
}

TEST(SetAggregator, unionOfEmptySetsIsEmpty) {
    std::vector<ByteArraySet> operands{setOf({}), setOf({})};
    EXPECT_TRUE(SetAggregator::aggregate(SetOperation::Union, operands).empty());
}

TEST(SetAggregator, intersection) {
    std::vector<ByteArraySet> operands{setOf({"a", "b", "c"}),
                                       setOf({"b", "c", "d"}),
                                       setOf({"c", "b", "x"})};
    EXPECT_EQ(SetAggregator::aggregate(SetOperation::Intersect, operands),
              setOf({"b", "c"}));
}

TEST(SetAggregator, intersectionStopsAtFirstEmptyResult) {
    std::vector<ByteArraySet> operands{setOf({"a"}), setOf({"b"}),
                                       setOf({"a"}), setOf({"a"})};
    std::vector<size_t> requested;

    ByteArraySet result = SetAggregator::aggregate(
        SetOperation::Intersect, operands.size(),
        [&](size_t i) -> const ByteArraySet& {
            requested.push_back(i);
            return operands[i];
        });

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(requested, (std::vector<size_t>{0, 1}))
        << "operands after the empty intersection are never requested";
}

TEST(SetAggregator, intersectionWithEmptyFirstOperand) {
    std::vector<ByteArraySet> operands{setOf({}), setOf({"a"}), setOf({"a"})};
    int requests = 0;

    ByteArraySet result = SetAggregator::aggregate(
        SetOperation::Intersect, operands.size(),
        [&](size_t i) -> const ByteArraySet& {
            requests++;
            return operands[i];
        });

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(requests, 1);
}

TEST(SetAggregator, differenceIsOrderSensitive) {
    ByteArraySet a = setOf({"x", "y"});
    ByteArraySet b = setOf({"y", "z"});

    EXPECT_EQ(SetAggregator::aggregate(SetOperation::Difference, {a, b}),
              setOf({"x"}));
    EXPECT_EQ(SetAggregator::aggregate(SetOperation::Difference, {b, a}),
              setOf({"z"}));
}

TEST(SetAggregator, differenceSubtractsEveryLaterOperand) {
    std::vector<ByteArraySet> operands{setOf({"a", "b", "c", "d"}),
                                       setOf({"b"}), setOf({"d", "q"})};
    EXPECT_EQ(SetAggregator::aggregate(SetOperation::Difference, operands),
              setOf({"a", "c"}));
}

TEST(SetAggregator, singleOperandIsReturnedAsIs) {
    for (auto op : {SetOperation::Intersect, SetOperation::Union,
                    SetOperation::Difference}) {
        EXPECT_EQ(SetAggregator::aggregate(op, {setOf({"a", "b"})}),
                  setOf({"a", "b"}))
            << operationName(op);
    }
}

TEST(SetAggregator, noOperandsGiveEmptySet) {
    EXPECT_TRUE(SetAggregator::aggregate(SetOperation::Union, {}).empty());
}
