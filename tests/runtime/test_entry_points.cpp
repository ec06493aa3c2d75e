/**
 * @file test_entry_points.cpp
 * @brief Boolean checks, equality checks and assertions
 */

#include "typeguard/config.hpp"
#include "typeguard/descriptor.hpp"
#include "typeguard/normalizer.hpp"
#include "typeguard/typeguard.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace typeguard::test {

namespace {

using Json = nlohmann::json;

/// Restores the process-wide settings and message hook.
class SettingsRestore
{
public:
    SettingsRestore()
        : m_saved(config::current())
    {}
    ~SettingsRestore()
    {
        config::apply(m_saved);
        config::set_default_message_hook({});
    }
    SettingsRestore(const SettingsRestore&) = delete;
    SettingsRestore& operator=(const SettingsRestore&) = delete;

private:
    config::Settings m_saved;
};

NormalizedType user_type()
{
    auto object = types::object({
        Property{.name = "name", .type = types::string()},
        Property{.name = "age", .type = types::number(), .optional = true},
    });
    EXPECT_TRUE(object);
    auto normalized = normalize(*object);
    EXPECT_TRUE(normalized);
    return *normalized;
}

}  // namespace

TEST(EntryPointsTest, IsAcceptsExtraProperties)
{
    const auto type = user_type();
    auto plain = is(type, Json{{"name", "ada"}});
    ASSERT_TRUE(plain);
    EXPECT_TRUE(*plain);

    auto extra = is(type, Json{{"name", "ada"}, {"role", "admin"}});
    ASSERT_TRUE(extra);
    EXPECT_TRUE(*extra);

    auto wrong = is(type, Json{{"name", 1}});
    ASSERT_TRUE(wrong);
    EXPECT_FALSE(*wrong);
}

TEST(EntryPointsTest, EqualsRejectsExtraProperties)
{
    auto object = types::object({Property{.name = "x", .type = types::string()}});
    ASSERT_TRUE(object);
    auto type = normalize(*object);
    ASSERT_TRUE(type);

    auto exact = equals(*type, Json{{"x", "a"}});
    ASSERT_TRUE(exact);
    EXPECT_TRUE(*exact);

    auto extra = equals(*type, Json{{"x", "a"}, {"y", "b"}});
    ASSERT_TRUE(extra);
    EXPECT_FALSE(*extra);

    auto missing = equals(*type, Json::object());
    ASSERT_TRUE(missing);
    EXPECT_FALSE(*missing);
}

TEST(EntryPointsTest, CreatedPredicates)
{
    const auto type = user_type();
    auto is_user = create_is(type);
    auto equals_user = create_equals(type);
    ASSERT_TRUE(is_user);
    ASSERT_TRUE(equals_user);

    const Json value = {
        {"name", "ada"},
        {"team", "core"}
    };
    EXPECT_TRUE((*is_user)(value));
    EXPECT_FALSE((*equals_user)(value));
    EXPECT_FALSE((*is_user)(Json("ada")));
}

TEST(EntryPointsTest, AssertReturnsTheSameValue)
{
    const auto type = user_type();
    const Json value = {
        {"name", "ada"}
    };
    auto result = assert_type(type, value);
    ASSERT_TRUE(result);
    EXPECT_EQ(&result->get(), &value);

    auto strict = assert_equals(type, value);
    ASSERT_TRUE(strict);
    EXPECT_EQ(&strict->get(), &value);
}

TEST(EntryPointsTest, AssertThrowsWithRenderedMessage)
{
    SettingsRestore restore;
    config::apply(config::Settings{});

    const auto type = user_type();
    try {
        static_cast<void>(assert_type(type, Json{{"name", "ada"}, {"age", "old"}}));
        FAIL() << "expected TypeGuardError";
    } catch (const TypeGuardError& error) {
        EXPECT_STREQ(error.what(), "validation failed at $.age: expected number, got string");
        EXPECT_EQ(error.failure().kind, FailureKind::kTypeMismatch);
        EXPECT_EQ(render_path(error.failure().path), "$.age");
    }
}

TEST(EntryPointsTest, AssertEqualsThrowsOnSuperfluousProperty)
{
    const auto type = user_type();
    EXPECT_THROW(static_cast<void>(assert_equals(type, Json{{"name", "ada"}, {"extra", 1}})),
                 TypeGuardError);
    EXPECT_NO_THROW(static_cast<void>(assert_type(type, Json{{"name", "ada"}, {"extra", 1}})));
}

TEST(EntryPointsTest, CustomAssertionMessage)
{
    const auto type = user_type();
    auto assertion =
        create_assert_type(type, AssertOptions{.message = std::string("not a user")});
    ASSERT_TRUE(assertion);
    try {
        static_cast<void>((*assertion)(Json(42)));
        FAIL() << "expected TypeGuardError";
    } catch (const TypeGuardError& error) {
        EXPECT_STREQ(error.what(), "not a user");
        EXPECT_EQ(error.failure().actual, "number");
    }

    const Json good = {
        {"name", "grace"}
    };
    EXPECT_EQ(&(*assertion)(good), &good);
}

TEST(EntryPointsTest, CreatedEqualityAssertion)
{
    const auto type = user_type();
    auto assertion = create_assert_equals(type);
    ASSERT_TRUE(assertion);
    EXPECT_NO_THROW(static_cast<void>((*assertion)(Json{{"name", "a"}, {"age", 3}})));
    EXPECT_THROW(static_cast<void>((*assertion)(Json{{"name", "a"}, {"id", 3}})), TypeGuardError);
}

TEST(EntryPointsTest, ConstructionErrorsAreReported)
{
    NormalizedType open{.root = types::parameter("T"), .definitions = {}, .fingerprint = "open"};
    auto result = is(open, Json(1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, errc::kUnboundTypeParameter);

    auto guard = make_guard(types::reference("Nowhere"));
    ASSERT_FALSE(guard);
    EXPECT_EQ(guard.error().code, errc::kUnresolvedReference);
}

TEST(EntryPointsTest, MakeGuardWithRegistry)
{
    TypeRegistry registry;
    ASSERT_TRUE(registry.define("Id", types::union_of({types::string(), types::number()})));
    auto guard = make_guard(types::array(types::reference("Id")), registry);
    ASSERT_TRUE(guard) << guard.error().message;
    EXPECT_TRUE(guard->is(Json{1, "two", 3}));
    EXPECT_FALSE(guard->is(Json{1, nullptr}));

    auto verdict = guard->check(Json{1, nullptr});
    ASSERT_TRUE(verdict);
    EXPECT_EQ(render_path(verdict->path), "$[1]");
    EXPECT_EQ(verdict->kind, FailureKind::kNoUnionMemberMatched);
}

TEST(EntryPointsTest, ShortCircuitPassesEverything)
{
    SettingsRestore restore;
    auto settings = config::current();
    settings.short_circuit = true;
    config::apply(settings);

    const auto type = user_type();
    auto guard = TypeGuard::create(type);
    ASSERT_TRUE(guard);
    EXPECT_TRUE(guard->short_circuit());
    EXPECT_TRUE(guard->is(Json(nullptr)));
    EXPECT_TRUE(guard->equals(Json{{"name", "a"}, {"x", 1}}));
    EXPECT_FALSE(guard->check(Json(5)));
    EXPECT_TRUE(guard->diagnose(Json(5)).empty());
    EXPECT_NO_THROW(static_cast<void>(guard->assert_type(Json(5))));
}

TEST(EntryPointsTest, ShortCircuitIsReadAtCreation)
{
    SettingsRestore restore;
    const auto type = user_type();
    auto settings = config::current();
    settings.short_circuit = false;
    config::apply(settings);
    auto guard = TypeGuard::create(type);
    ASSERT_TRUE(guard);

    settings.short_circuit = true;
    config::apply(settings);
    EXPECT_FALSE(guard->is(Json(5)));
}

TEST(EntryPointsTest, GuardsShareTheCompiledValidator)
{
    const auto type = user_type();
    auto first = TypeGuard::create(type);
    auto second = TypeGuard::create(user_type());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->validator().fingerprint(), second->validator().fingerprint());
    EXPECT_TRUE(ValidatorCache::global().find(type.fingerprint).has_value());
}

}  // namespace typeguard::test
