#include <gtest/gtest.h>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

#include "alternating_no_remainder.hpp"
#include "source.hpp"
#include "test_util.hpp"

namespace alternating {
namespace test {

namespace {

constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();

std::unique_ptr<AlternatingNoRemainder<int>> Over(const std::vector<int>& left, const std::vector<int>& right) {
    return AlternatingNoRemainder<int>::Create(FromRange(left), FromRange(right));
}

}  // namespace

TEST(AlternatingNoRemainderTest, IsFused) {
    auto iter = AlternatingNoRemainder<int>::Create(Iota(1, 3), Repeat(0));

    EXPECT_EQ(iter->Next(), std::optional<int>(1));
    EXPECT_EQ(iter->Next(), std::optional<int>(0));
    EXPECT_EQ(iter->Next(), std::optional<int>(2));
    EXPECT_EQ(iter->Next(), std::optional<int>(0));
    EXPECT_EQ(iter->Next(), std::nullopt);
    EXPECT_TRUE(iter->IsDone());
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, SameLengths) {
    const std::vector<int> a = {1, 2};
    const std::vector<int> b = {3, 4};
    auto iter = Over(a, b);

    EXPECT_EQ(Collect(*iter), (std::vector<int>{1, 3, 2, 4}));
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, RightLongerByOne) {
    const std::vector<int> a = {1, 2};
    const std::vector<int> b = {3, 4, 5};
    auto iter = Over(a, b);

    EXPECT_EQ(iter->Next(), std::optional<int>(1));
    EXPECT_EQ(iter->Next(), std::optional<int>(3));
    EXPECT_EQ(iter->Next(), std::optional<int>(2));
    EXPECT_EQ(iter->Next(), std::optional<int>(4));
    EXPECT_EQ(iter->Next(), std::nullopt);
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, RightLongerByTwo) {
    const std::vector<int> a = {1, 2};
    const std::vector<int> b = {3, 4, 5, 6};
    auto iter = Over(a, b);

    EXPECT_EQ(Collect(*iter), (std::vector<int>{1, 3, 2, 4}));
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, OrderOfSourcesMatters) {
    const std::vector<int> small = {1, 2};
    const std::vector<int> big = {3, 4, 5};

    auto small_first = Over(small, big);
    EXPECT_EQ(Count(*small_first), 4u);

    auto big_first = Over(big, small);
    EXPECT_EQ(Count(*big_first), 5u);
}

TEST(AlternatingNoRemainderTest, EmptySources) {
    const std::vector<int> a;
    const std::vector<int> b;
    auto iter = Over(a, b);

    EXPECT_EQ(iter->Next(), std::nullopt);
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, OneEmptySource) {
    const std::vector<int> a = {1, 2, 3};
    const std::vector<int> b;
    auto iter = Over(a, b);

    EXPECT_EQ(iter->Next(), std::optional<int>(1));
    EXPECT_EQ(iter->Next(), std::nullopt);
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, SameContainerOnBothSides) {
    const std::vector<int> a = {1, 2, 3};
    auto iter = Over(a, a);

    EXPECT_EQ(Collect(*iter), (std::vector<int>{1, 1, 2, 2, 3, 3}));
    NoMore(*iter);
}

TEST(AlternatingNoRemainderTest, StopsPullingAfterFirstGap) {
    auto left = std::make_unique<ScriptedSource<int>>(std::vector<std::optional<int>>{1, std::nullopt, 5});
    auto right = std::make_unique<ScriptedSource<int>>(std::vector<std::optional<int>>{2, 3, 4});
    auto left_pulls = left->Pulls();
    auto right_pulls = right->Pulls();

    auto iter = AlternatingNoRemainder<int>::Create(std::move(left), std::move(right));

    EXPECT_EQ(iter->Next(), std::optional<int>(1));
    EXPECT_EQ(iter->Next(), std::optional<int>(2));
    EXPECT_EQ(iter->Next(), std::nullopt);
    NoMore(*iter);

    EXPECT_EQ(*left_pulls, 2u);
    EXPECT_EQ(*right_pulls, 1u);
}

TEST(AlternatingNoRemainderTest, RejectsNullSource) {
    EXPECT_THROW(AlternatingNoRemainder<int>(Empty<int>(), nullptr), std::invalid_argument);
}

TEST(AlternatingNoRemainderTest, SizeHintMatchesCount) {
    const std::vector<int> a = {1, 2, 3};
    const std::vector<int> b = {4, 5};
    auto iter = Over(a, b);

    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Exact(5));
    EXPECT_EQ(Count(*iter), 5u);
    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Exact(0));
}

TEST(AlternatingNoRemainderTest, SizeHintMatchesCountForManyShapes) {
    for (int left_len = 0; left_len <= 6; ++left_len) {
        for (int right_len = 0; right_len <= 6; ++right_len) {
            auto iter = AlternatingNoRemainder<int>::Create(Iota(0, left_len), Iota(100, 100 + right_len));
            auto hint = iter->GetSizeHint();
            ASSERT_TRUE(hint.upper.has_value());
            EXPECT_EQ(*hint.upper, Count(*iter)) << "left=" << left_len << " right=" << right_len;
        }
    }
}

TEST(AlternatingNoRemainderTest, SizeHintUnboundedRight) {
    const std::vector<int> a = {1, 2, 3};
    auto iter = AlternatingNoRemainder<int>::Create(FromRange(a), Repeat(0));

    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Exact(6));
    EXPECT_EQ(Count(*iter), 6u);
}

TEST(AlternatingNoRemainderTest, SizeHintUnboundedLeft) {
    const std::vector<int> b = {1, 2, 3};
    auto iter = AlternatingNoRemainder<int>::Create(Repeat(0), FromRange(b));

    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Exact(7));
    EXPECT_EQ(Count(*iter), 7u);
}

TEST(AlternatingNoRemainderTest, SizeHintBoundExceedsMax) {
    auto iter = AlternatingNoRemainder<std::size_t>::Create(Iota<std::size_t>(0, kMax),
                                                            Iota<std::size_t>(0, kMax));
    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Unbounded(kMax));
}

TEST(AlternatingNoRemainderTest, SizeHintHalfMaxLeft) {
    auto iter = AlternatingNoRemainder<std::size_t>::Create(Iota<std::size_t>(0, kMax / 2),
                                                            Iota<std::size_t>(0, kMax / 2 + 1));
    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Exact(kMax - 1));
}

TEST(AlternatingNoRemainderTest, SizeHintHalfMaxRight) {
    auto iter = AlternatingNoRemainder<std::size_t>::Create(Iota<std::size_t>(0, kMax / 2 + 1),
                                                            Iota<std::size_t>(0, kMax / 2));
    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Exact(kMax));
}

TEST(AlternatingNoRemainderTest, SizeHintBothUnbounded) {
    auto iter = AlternatingNoRemainder<int>::Create(Repeat(0), Repeat(0));
    EXPECT_EQ(iter->GetSizeHint(), SizeHint::Unbounded(kMax));
}

}  // namespace test
}  // namespace alternating
