#include <array>
#include <memory_resource>
#include <new>
#include <utility>
#include <string_view>

#include <gtest/gtest.h>

#include "vellum/collecting_logger.hpp"
#include "vellum/diagnostic.hpp"
#include "vellum/rule_set_registry.hpp"
#include "vellum/services.hpp"
#include "vellum/tag_matching.hpp"

#include "test_resources.hpp"

namespace vellum {
namespace {

struct Rule_Set_Registry_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Rule_Set_Registry registry { logger };

    void SetUp() override
    {
        ASSERT_TRUE(registry.insert(Rule_Set {
            .name = u8"Anchor",
            .origin = u8"vellum-test",
            .rules = { Rule_Descriptor { .tag_name = u8"a",
                                         .required_attributes = { u8"asp-page" } } },
        }));
        ASSERT_TRUE(registry.insert(Rule_Set {
            .name = u8"Any_Version",
            .origin = u8"vellum-test",
            .rules = { Rule_Descriptor { .tag_name = u8"*",
                                         .required_attributes = { u8"asp-append-version" } } },
        }));
        ASSERT_TRUE(registry.insert(Rule_Set {
            .name = u8"Anchor_Fallback",
            .origin = u8"vellum-test",
            .rules = { Rule_Descriptor { .tag_name = u8"a", .required_attributes = {} } },
        }));
    }
};

TEST_F(Rule_Set_Registry_Test, find)
{
    EXPECT_EQ(registry.size(), 3);

    const Rule_Set* const anchor = registry.find(u8"Anchor");
    ASSERT_NE(anchor, nullptr);
    EXPECT_EQ(anchor->origin, u8"vellum-test");
    EXPECT_EQ(registry.find(u8"anchor"), nullptr);
    EXPECT_EQ(registry.find(u8"Missing"), nullptr);
}

TEST_F(Rule_Set_Registry_Test, duplicate_is_rejected)
{
    EXPECT_FALSE(registry.insert(Rule_Set { .name = u8"Anchor", .origin = u8"other", .rules = {} }));

    EXPECT_EQ(registry.size(), 3);
    EXPECT_EQ(registry.find(u8"Anchor")->origin, u8"vellum-test");
    EXPECT_TRUE(logger.was_logged(diagnostic::rule_set_duplicate));
}

TEST_F(Rule_Set_Registry_Test, resolve_in_registration_order)
{
    constexpr std::array<std::u8string_view, 2> page_attributes { u8"page", u8"append_version" };
    constexpr std::array<std::u8string_view, 1> version_attributes { u8"append-version" };
    constexpr std::array<std::u8string_view, 1> href_attributes { u8"href" };

    EXPECT_EQ(registry.resolve(u8"A", page_attributes).name, u8"Anchor");
    EXPECT_EQ(registry.resolve(u8"img", version_attributes).name, u8"Any_Version");
    EXPECT_EQ(registry.resolve(u8"a", href_attributes).name, u8"Anchor_Fallback");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Rule_Set_Registry_Test, resolve_unmatched)
{
    constexpr std::array<std::u8string_view, 1> attributes { u8"src" };

    const Rule_Set& resolved = registry.resolve(u8"img", attributes);

    EXPECT_EQ(&resolved, &Rule_Set::none());
    EXPECT_TRUE(logger.was_logged(diagnostic::rule_set_unresolved));
}

TEST(Rule_Set_Registry, empty)
{
    const Rule_Set_Registry registry;

    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(&registry.resolve(u8"div", {}), &Rule_Set::none());
}

#ifdef VELLUM_EXCEPTIONS
TEST(Rule_Set_Registry, failed_insert_leaves_registry_unchanged)
{
    Failing_Memory_Resource memory;
    Rule_Set_Registry registry { ignorant_logger, &memory };
    ASSERT_TRUE(registry.insert(Rule_Set {
        .name = u8"First",
        .origin = u8"vellum-test",
        .rules = { Rule_Descriptor { .tag_name = u8"first", .required_attributes = {} } },
    }));

    Rule_Set second {
        .name = u8"Second",
        .origin = u8"vellum-test",
        .rules = { Rule_Descriptor { .tag_name = u8"second", .required_attributes = {} } },
    };
    memory.fail = true;
    EXPECT_THROW(registry.insert(std::move(second)), std::bad_alloc);
    memory.fail = false;

    EXPECT_EQ(registry.size(), 1);
    EXPECT_EQ(registry.find(u8"Second"), nullptr);
    EXPECT_EQ(&registry.resolve(u8"second", {}), &Rule_Set::none());
    // The rule set is handed back, so registration can be retried.
    EXPECT_EQ(second.name, u8"Second");
    ASSERT_EQ(second.rules.size(), 1);

    ASSERT_TRUE(registry.insert(std::move(second)));
    EXPECT_EQ(registry.size(), 2);
    EXPECT_EQ(registry.resolve(u8"second", {}).name, u8"Second");
    EXPECT_NE(registry.find(u8"Second"), nullptr);
}
#endif

} // namespace
} // namespace vellum
