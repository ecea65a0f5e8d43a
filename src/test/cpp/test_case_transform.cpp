#include <string_view>

#include <gtest/gtest.h>

#include "vellum/util/case_transform.hpp"

namespace vellum {
namespace {

TEST(Case_Transform, simple_to_upper)
{
    EXPECT_EQ(simple_to_upper(U'a'), U'A');
    EXPECT_EQ(simple_to_upper(U'A'), U'A');
    EXPECT_EQ(simple_to_upper(U'-'), U'-');
    EXPECT_EQ(simple_to_upper(U'é'), U'É');
    EXPECT_EQ(simple_to_upper(U'ω'), U'Ω');
    EXPECT_EQ(simple_to_upper(U'ß'), U'ß');
}

TEST(Case_Transform, simple_to_lower)
{
    EXPECT_EQ(simple_to_lower(U'Z'), U'z');
    EXPECT_EQ(simple_to_lower(U'É'), U'é');
    EXPECT_EQ(simple_to_lower(U'Д'), U'д');
    EXPECT_EQ(simple_to_lower(U'1'), U'1');
}

TEST(Case_Transform, equals_ignore_case)
{
    EXPECT_TRUE(equals_ignore_case(u8"", u8""));
    EXPECT_TRUE(equals_ignore_case(u8"Widget", u8"wIDGET"));
    EXPECT_TRUE(equals_ignore_case(u8"élan", u8"ÉLAN"));
    EXPECT_FALSE(equals_ignore_case(u8"élan", u8"elan"));
    EXPECT_FALSE(equals_ignore_case(u8"ab", u8"abc"));
    EXPECT_FALSE(equals_ignore_case(u8"abc", u8"ab"));
}

} // namespace
} // namespace vellum
