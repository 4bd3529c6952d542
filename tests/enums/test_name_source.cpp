#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_enums.hpp"

using namespace ordinal::enums;
using namespace ordinal::test;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockNameSource : public NameSource {
public:
    MOCK_METHOD(std::vector<NameEntry>, declaredNames, (), (const, override));
};

class NameSourceTest : public ::testing::Test {
protected:
    DayEnum days_;
    TokenEnum tokens_;
};

TEST_F(NameSourceTest, DeclarationsKeepOrder) {
    DeclarationNameSource source;
    source.record(days_.Monday, "first");
    source.record(days_.Tuesday, "second");

    ASSERT_EQ(source.size(), 2u);
    auto entries = source.declaredNames();
    EXPECT_EQ(entries[0].value, &days_.Monday);
    EXPECT_EQ(entries[0].name, "first");
    EXPECT_EQ(entries[1].value, &days_.Tuesday);
    EXPECT_EQ(entries[1].name, "second");
}

TEST_F(NameSourceTest, ExternalSourceNamesUnnamedValues) {
    const auto& alpha = tokens_.create(ValueSpec{});
    const auto& beta = tokens_.create(ValueSpec{});

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{{&alpha, "alpha"},
                                                      {&beta, "beta"}}));
    tokens_.setNameSource(source);

    EXPECT_EQ(alpha.toString(), "alpha");
    EXPECT_EQ(beta.toString(), "beta");
    EXPECT_FALSE(alpha.hasExplicitName());
    EXPECT_EQ(&tokens_.withName("beta"), &beta);
}

TEST_F(NameSourceTest, EntriesOfOtherRegistriesAreIgnored) {
    const auto& token = tokens_.create(ValueSpec{});
    ASSERT_EQ(token.id(), days_.Monday.id());

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{
            {&days_.Monday, "Intruder"}, {nullptr, "Nobody"}}));
    tokens_.setNameSource(source);

    EXPECT_EQ(token.toString(), "<Invalid enum: no field for #0>");
    EXPECT_FALSE(tokens_.nameOf(0).has_value());
    EXPECT_EQ(tokens_.findByName("Intruder"), nullptr);
    EXPECT_EQ(days_.Monday.toString(), "Monday");
}

TEST_F(NameSourceTest, DeclaredNameTakesPrecedence) {
    const auto& first = tokens_.declare("first");

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .WillRepeatedly(
            Return(std::vector<NameEntry>{{&first, "shadowed"}}));
    tokens_.setNameSource(source);

    EXPECT_EQ(first.toString(), "first");
}

TEST_F(NameSourceTest, SourceIsOnlyConsultedOnCacheMiss) {
    const auto& alpha = tokens_.create(ValueSpec{});
    const auto& beta = tokens_.create(ValueSpec{});

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .Times(2)
        .WillRepeatedly(Return(std::vector<NameEntry>{{&alpha, "alpha"},
                                                      {&beta, "beta"}}));
    tokens_.setNameSource(source);

    EXPECT_EQ(alpha.toString(), "alpha");
    EXPECT_EQ(beta.toString(), "beta");
    EXPECT_EQ(alpha.toString(), "alpha");
    // An unknown id misses and repopulates once more
    EXPECT_FALSE(tokens_.nameOf(99).has_value());
}

TEST_F(NameSourceTest, ReplacingTheSourceClearsTheCache) {
    const auto& token = tokens_.create(ValueSpec{});

    auto before = std::make_shared<MockNameSource>();
    EXPECT_CALL(*before, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{{&token, "before"}}));
    tokens_.setNameSource(before);
    EXPECT_EQ(token.toString(), "before");

    auto after = std::make_shared<MockNameSource>();
    EXPECT_CALL(*after, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{{&token, "after"}}));
    tokens_.setNameSource(after);
    EXPECT_EQ(token.toString(), "after");
}

TEST_F(NameSourceTest, ClearingTheSourceFallsBackToPlaceholder) {
    const auto& token = tokens_.create(ValueSpec{.id = 7});

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{{&token, "seven"}}));
    tokens_.setNameSource(source);
    EXPECT_EQ(token.toString(), "seven");

    tokens_.setNameSource(nullptr);
    EXPECT_EQ(token.toString(), "<Invalid enum: no field for #7>");
}

TEST_F(NameSourceTest, NameLookupsFollowSourceChanges) {
    const auto& token = tokens_.create(ValueSpec{});
    EXPECT_EQ(tokens_.findByName("before"), nullptr);

    auto before = std::make_shared<MockNameSource>();
    EXPECT_CALL(*before, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{{&token, "before"}}));
    tokens_.setNameSource(before);
    EXPECT_EQ(&tokens_.withName("before"), &token);

    auto after = std::make_shared<MockNameSource>();
    EXPECT_CALL(*after, declaredNames())
        .WillRepeatedly(Return(std::vector<NameEntry>{{&token, "after"}}));
    tokens_.setNameSource(after);
    EXPECT_EQ(tokens_.findByName("after"), &token);
    EXPECT_EQ(tokens_.findByName("before"), nullptr);
    EXPECT_EQ(tokens_.values().front().toString(), "after");
}

TEST_F(NameSourceTest, SourceMayDisplayValuesOfTheSameRegistry) {
    const auto& base = tokens_.declare("base");
    const auto& token = tokens_.create(ValueSpec{});

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .WillRepeatedly(Invoke([&base, &token] {
            // The nested lookup of the unnamed token only sees declarations
            return std::vector<NameEntry>{
                {&token, base.toString() + "+" + token.toString()}};
        }));
    tokens_.setNameSource(source);

    auto rendered = std::async(std::launch::async,
                               [&token] { return token.toString(); });
    ASSERT_EQ(rendered.wait_for(std::chrono::seconds(5)),
              std::future_status::ready);
    EXPECT_EQ(rendered.get(), "base+<Invalid enum: no field for #1>");
    EXPECT_EQ(base.toString(), "base");
}

TEST_F(NameSourceTest, SourceExceptionsPropagateFromToString) {
    const auto& token = tokens_.create(ValueSpec{});

    auto source = std::make_shared<MockNameSource>();
    EXPECT_CALL(*source, declaredNames())
        .WillOnce(Throw(std::runtime_error("source unavailable")))
        .WillOnce(Return(std::vector<NameEntry>{{&token, "recovered"}}));
    tokens_.setNameSource(source);

    EXPECT_THROW((void)token.toString(), std::runtime_error);
    EXPECT_FALSE(token.hasExplicitName());
    EXPECT_EQ(token.toString(), "recovered");
}

}  // namespace
