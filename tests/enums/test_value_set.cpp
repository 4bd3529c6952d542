#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include "spdlog/sinks/ringbuffer_sink.h"
#include "spdlog/spdlog.h"

#include "test_enums.hpp"

using namespace ordinal::enums;
using namespace ordinal::test;
using ordinal::type::FlatSet;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

class ValueSetTest : public ::testing::Test {
protected:
    auto namesOf(const ValueSet<Day>& set) -> std::vector<std::string> {
        return set.mapToVector([](const Day& day) { return day.toString(); });
    }

    DayEnum days_;
};

TEST_F(ValueSetTest, AllValuesExportAsOneWord) {
    auto all = days_.values();
    EXPECT_EQ(all.size(), 7u);
    EXPECT_EQ(all.toBitMask(), std::vector<std::uint64_t>{0x7F});
}

TEST_F(ValueSetTest, BitMaskRoundTrip) {
    const ValueSet<Day> set{days_.Monday, days_.Wednesday, days_.Sunday};
    const auto words = set.toBitMask();
    EXPECT_EQ(words, std::vector<std::uint64_t>{0x45});
    EXPECT_EQ(days_.fromBitMask(words), set);
}

TEST_F(ValueSetTest, EmptySetBitMaskRoundTrip) {
    auto none = days_.emptySet();
    EXPECT_EQ(none.size(), 0u);
    EXPECT_TRUE(none.empty());
    EXPECT_TRUE(none.toBitMask().empty());
    EXPECT_TRUE(days_.fromBitMask({}).empty());
}

TEST_F(ValueSetTest, ExportSpansSeveralWords) {
    TokenEnum tokens;
    const auto& low = tokens.create(ValueSpec{});
    const auto& high = tokens.create(ValueSpec{.id = 130});
    auto set = low + high;

    const auto words = set.toBitMask();
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], 1u);
    EXPECT_EQ(words[1], 0u);
    EXPECT_EQ(words[2], std::uint64_t{1} << 2);
    EXPECT_EQ(tokens.fromBitMask(words), set);
    EXPECT_EQ(set.back(), high);
}

TEST_F(ValueSetTest, NegativeIdsAreIndexedFromMinId) {
    TokenEnum tokens({.name = "Signed", .initialId = -2});
    const auto& a = tokens.create(ValueSpec{});
    (void)tokens.create(ValueSpec{});
    const auto& c = tokens.create(ValueSpec{});
    ASSERT_EQ(a.id(), -2);
    ASSERT_EQ(c.id(), 0);

    auto set = a + c;
    EXPECT_EQ(set.toBitMask(), std::vector<std::uint64_t>{0b101});
    EXPECT_EQ(set.front(), a);
}

TEST_F(ValueSetTest, SetsSurviveLowerMinId) {
    TokenEnum tokens({.name = "Signed", .initialId = -2});
    const auto& a = tokens.create(ValueSpec{});
    (void)tokens.create(ValueSpec{});
    const auto& c = tokens.create(ValueSpec{});
    auto set = a + c;

    const auto& lowest = tokens.create(ValueSpec{.id = -5});
    ASSERT_EQ(tokens.minId(), -5);

    // Exports follow the registry's current minId
    const auto words = set.toBitMask();
    EXPECT_EQ(words, std::vector<std::uint64_t>{0b101000});
    EXPECT_EQ(tokens.fromBitMask(words), set);

    auto grown = set + lowest;
    EXPECT_EQ(grown.size(), 3u);
    EXPECT_EQ(grown.front(), lowest);
    EXPECT_TRUE(set.isSubsetOf(tokens.values()));
    EXPECT_EQ((tokens.values() & set), set);
}

TEST_F(ValueSetTest, InsertIsPersistentAndIdempotent) {
    auto none = days_.emptySet();
    auto once = none.insert(days_.Monday);
    auto twice = once.insert(days_.Monday);

    EXPECT_TRUE(none.empty());
    EXPECT_EQ(once.size(), 1u);
    EXPECT_EQ(once, twice);
    EXPECT_TRUE(once.contains(days_.Monday));
}

TEST_F(ValueSetTest, RemoveIsPersistentAndIdempotent) {
    auto all = days_.values();
    auto without = all.remove(days_.Friday);
    auto again = without.remove(days_.Friday);

    EXPECT_EQ(all.size(), 7u);
    EXPECT_EQ(without.size(), 6u);
    EXPECT_EQ(without, again);
    EXPECT_FALSE(without.contains(days_.Friday));
    EXPECT_EQ(all - days_.Friday, without);
    EXPECT_EQ(without + days_.Friday, all);
}

TEST_F(ValueSetTest, IteratesInAscendingIdOrder) {
    auto set = days_.emptySet()
                   .insert(days_.Sunday)
                   .insert(days_.Monday)
                   .insert(days_.Wednesday);
    EXPECT_THAT(namesOf(set), ElementsAre("Monday", "Wednesday", "Sunday"));

    int previous = -1;
    for (const Day& day : days_.values()) {
        EXPECT_GT(day.id(), previous);
        previous = day.id();
    }
}

TEST_F(ValueSetTest, ContainsRejectsOtherRegistries) {
    DayEnum otherDays;
    auto all = days_.values();
    EXPECT_TRUE(all.contains(days_.Tuesday));
    EXPECT_FALSE(all.contains(otherDays.Tuesday));
}

TEST_F(ValueSetTest, FrontAndBack) {
    auto weekend = days_.Saturday + days_.Sunday;
    EXPECT_EQ(weekend.front(), days_.Saturday);
    EXPECT_EQ(weekend.back(), days_.Sunday);
}

TEST_F(ValueSetTest, FrontAndBackOfEmptySetThrow) {
    auto none = days_.emptySet();
    EXPECT_THROW((void)none.front(), ordinal::error::OutOfRange);
    EXPECT_THROW((void)none.back(), ordinal::error::OutOfRange);
    EXPECT_THROW((void)ValueSet<Day>().front(), ordinal::error::OutOfRange);
}

TEST_F(ValueSetTest, IteratorFromSkipsLowerIds) {
    const ValueSet<Day> set{days_.Monday, days_.Wednesday, days_.Friday};
    EXPECT_EQ(*set.iteratorFrom(days_.Tuesday), days_.Wednesday);
    EXPECT_EQ(*set.iteratorFrom(days_.Wednesday), days_.Wednesday);
    EXPECT_TRUE(set.iteratorFrom(days_.Monday) == set.begin());
    EXPECT_TRUE(set.iteratorFrom(days_.Saturday) == set.end());
}

TEST_F(ValueSetTest, RangeQueries) {
    auto all = days_.values();
    EXPECT_THAT(namesOf(all.range(days_.Tuesday, days_.Friday)),
                ElementsAre("Tuesday", "Wednesday", "Thursday"));
    EXPECT_THAT(namesOf(all.rangeFrom(days_.Friday)),
                ElementsAre("Friday", "Saturday", "Sunday"));
    EXPECT_THAT(namesOf(all.rangeUntil(days_.Wednesday)),
                ElementsAre("Monday", "Tuesday"));
    EXPECT_TRUE(all.range(days_.Thursday, days_.Thursday).empty());
    EXPECT_EQ(all.range(std::nullopt, std::nullopt), all);
    EXPECT_THAT(namesOf(all.range(-10, 2)), ElementsAre("Monday", "Tuesday"));
    EXPECT_TRUE(all.range(40, 50).empty());
}

TEST_F(ValueSetTest, InvertedRangeThrows) {
    auto all = days_.values();
    EXPECT_THROW((void)all.range(days_.Friday, days_.Tuesday),
                 ordinal::error::InvalidArgument);
}

// Routes the default logger into a ring buffer for the test's duration
class ValueSetErrorLogTest : public ValueSetTest {
protected:
    void SetUp() override {
        previous_ = spdlog::default_logger();
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
        sink_->set_pattern("%l %v");
        spdlog::set_default_logger(
            std::make_shared<spdlog::logger>("value_set_errors", sink_));
    }

    void TearDown() override { spdlog::set_default_logger(previous_); }

    auto lastLine() -> std::string {
        auto lines = sink_->last_formatted(1);
        return lines.empty() ? std::string() : lines.front();
    }

    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

TEST_F(ValueSetErrorLogTest, EmptyAccessIsLoggedBeforeThrowing) {
    auto none = days_.emptySet();
    EXPECT_THROW((void)none.front(), ordinal::error::OutOfRange);
    EXPECT_THAT(lastLine(), HasSubstr("error front() called on an empty"));
    EXPECT_THROW((void)none.back(), ordinal::error::OutOfRange);
    EXPECT_THAT(lastLine(), HasSubstr("error back() called on an empty"));
}

TEST_F(ValueSetErrorLogTest, InvertedRangeIsLoggedBeforeThrowing) {
    auto all = days_.values();
    EXPECT_THROW((void)all.range(4, 1), ordinal::error::InvalidArgument);
    EXPECT_THAT(lastLine(), HasSubstr("error Invalid id range: 4 > 1"));
}

TEST_F(ValueSetTest, SetAlgebra) {
    const ValueSet<Day> a{days_.Monday, days_.Tuesday, days_.Wednesday};
    const ValueSet<Day> b{days_.Tuesday, days_.Wednesday, days_.Thursday};

    EXPECT_EQ((a | b).size(), 4u);
    EXPECT_THAT(namesOf(a & b), ElementsAre("Tuesday", "Wednesday"));
    EXPECT_THAT(namesOf(a - b), ElementsAre("Monday"));
    EXPECT_EQ(a.unite(b), a | b);
    EXPECT_EQ(a.intersect(b), a & b);
    EXPECT_EQ(a.difference(b), a - b);

    EXPECT_TRUE((a & b).isSubsetOf(a));
    EXPECT_FALSE(a.isSubsetOf(b));
    EXPECT_TRUE(days_.emptySet().isSubsetOf(a));
}

TEST_F(ValueSetTest, AlgebraAcrossRegistriesThrows) {
    DayEnum otherDays;
    auto mine = days_.values();
    auto theirs = otherDays.values();

    EXPECT_THROW((void)(mine | theirs), CrossRegistryOperationError);
    EXPECT_THROW((void)(mine & theirs), CrossRegistryOperationError);
    EXPECT_THROW((void)(mine - theirs), CrossRegistryOperationError);
    EXPECT_THROW((void)mine.insert(otherDays.Monday),
                 CrossRegistryOperationError);
    EXPECT_FALSE(mine.isSubsetOf(theirs));
}

TEST_F(ValueSetTest, UnboundSetBindsOnFirstUse) {
    ValueSet<Day> unbound;
    EXPECT_TRUE(unbound.empty());
    EXPECT_EQ(unbound.registry(), nullptr);
    EXPECT_TRUE(unbound.toBitMask().empty());
    EXPECT_EQ(unbound.toString(), "ValueSet()");

    auto all = days_.values();
    EXPECT_EQ(unbound | all, all);
    EXPECT_EQ(all - unbound, all);
    EXPECT_EQ(unbound.insert(days_.Monday).registry(), &days_);
}

TEST_F(ValueSetTest, EmptySetsAreAlwaysEqual) {
    DayEnum otherDays;
    EXPECT_EQ(days_.emptySet(), ValueSet<Day>());
    EXPECT_EQ(days_.emptySet(), otherDays.emptySet());
    EXPECT_NE(days_.values(), otherDays.values());
}

TEST_F(ValueSetTest, FilterAndPartition) {
    auto all = days_.values();
    auto working = all.filter(&Day::isWorkingDay);
    auto weekend = all.filterNot(&Day::isWorkingDay);

    EXPECT_EQ(working.size(), 5u);
    EXPECT_EQ(weekend, days_.Saturday + days_.Sunday);

    auto [accepted, rejected] = all.partition(&Day::isWorkingDay);
    EXPECT_EQ(accepted, working);
    EXPECT_EQ(rejected, weekend);
}

TEST_F(ValueSetTest, MapToSameEnumerationStaysAValueSet) {
    auto mapped = days_.values()
                      .filter(&Day::isWorkingDay)
                      .map([](const Day& day) -> const Day& { return day; });
    static_assert(std::is_same_v<decltype(mapped), ValueSet<Day>>);
    EXPECT_EQ(mapped.size(), 5u);
    EXPECT_EQ(mapped.registry(), &days_);

    auto shifted = days_.values().map([this](const Day& day) -> const Day& {
        return days_.value((day.id() + 1) % 7);
    });
    EXPECT_EQ(shifted, days_.values());
}

TEST_F(ValueSetTest, MapToSubclassReferenceStaysAValueSet) {
    OperationEnum operations;
    auto mapped = operations.values().map(
        [&operations](const Operation&) -> const Plus& {
            return operations.Add;
        });
    static_assert(std::is_same_v<decltype(mapped), ValueSet<Operation>>);
    EXPECT_EQ(mapped.size(), 1u);
    EXPECT_EQ(mapped.front(), operations.Add);
}

TEST_F(ValueSetTest, MapToOtherEnumerationGivesItsValueSet) {
    ColorEnum colors;
    auto mapped = days_.values().map(
        [&colors](const Day& day) -> const Color& {
            return colors.value(day.id() % 3);
        });
    static_assert(std::is_same_v<decltype(mapped), ValueSet<Color>>);
    EXPECT_EQ(mapped, colors.values());
}

TEST_F(ValueSetTest, MapToOrderedTypeGivesFlatSet) {
    auto mapped =
        days_.values().map([](const Day& day) { return day.id() % 3; });
    static_assert(std::is_same_v<decltype(mapped), FlatSet<int>>);
    EXPECT_EQ(mapped, (FlatSet<int>{0, 1, 2}));

    auto names = days_.values().map(
        [](const Day& day) { return day.toString().substr(0, 1); });
    EXPECT_THAT(names, ElementsAre("F", "M", "S", "T", "W"));
}

TEST_F(ValueSetTest, FlatMapJoinsResults) {
    auto ids = (days_.Monday + days_.Friday).flatMap([](const Day& day) {
        return std::vector<int>{day.id(), day.id() + 10};
    });
    static_assert(std::is_same_v<decltype(ids), FlatSet<int>>);
    EXPECT_THAT(ids, ElementsAre(0, 4, 10, 14));

    auto withSaturday = days_.values()
                            .filter(&Day::isWorkingDay)
                            .flatMap([this](const Day& day) {
                                return days_.Saturday + day;
                            });
    static_assert(std::is_same_v<decltype(withSaturday), ValueSet<Day>>);
    EXPECT_EQ(withSaturday, days_.values() - days_.Sunday);
}

TEST_F(ValueSetTest, MapToVectorKeepsIterationOrder) {
    auto lengths = days_.values().mapToVector(
        [](const Day& day) { return day.toString().size(); });
    EXPECT_THAT(lengths, ElementsAre(6u, 7u, 9u, 8u, 6u, 8u, 6u));

    auto refs = days_.values().mapToVector(
        [](const Day& day) -> const Day& { return day; });
    ASSERT_EQ(refs.size(), 7u);
    EXPECT_EQ(&refs[3].get(), &days_.Thursday);
}

TEST_F(ValueSetTest, WithNameIsScopedToTheSet) {
    auto weekend = days_.Saturday + days_.Sunday;
    EXPECT_EQ(&weekend.withName("Sunday"), &days_.Sunday);
    EXPECT_EQ(weekend.findByName("Monday"), nullptr);
    EXPECT_THROW((void)weekend.withName("Monday"), UnknownNameError);
}

TEST_F(ValueSetTest, BuilderAccumulates) {
    ValueSet<Day>::Builder builder(days_);
    EXPECT_TRUE(builder.result().empty());
    EXPECT_EQ(builder.result().registry(), &days_);

    builder.add(days_.Friday).add(days_.Monday).add(days_.Friday);
    EXPECT_EQ(builder.result(), days_.Monday + days_.Friday);

    builder.addAll(days_.values().filterNot(&Day::isWorkingDay));
    EXPECT_EQ(builder.result().size(), 4u);

    builder.clear();
    EXPECT_TRUE(builder.result().empty());
}

TEST_F(ValueSetTest, BuilderRejectsOtherRegistries) {
    DayEnum otherDays;
    ValueSet<Day>::Builder builder(days_);
    EXPECT_THROW(builder.add(otherDays.Monday), CrossRegistryOperationError);
}

TEST_F(ValueSetTest, StreamsDisplayForm) {
    std::ostringstream oss;
    oss << (days_.Monday + days_.Sunday);
    EXPECT_EQ(oss.str(), "Day.ValueSet(Monday, Sunday)");
}

}  // namespace
