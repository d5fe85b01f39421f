#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "mesh_cpp/error.hpp"
#include "mesh_cpp/result.hpp"

using mesh_cpp::Error;
using mesh_cpp::Result;

TEST(ResultTest, OkAndHasValue) {
    auto r = Result<int>::ok(42);
    EXPECT_TRUE(r.has_value());
    EXPECT_FALSE(r.has_error());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrorAndHasError) {
    auto r = Result<int>::err(Error::Code::DiscoveryFailed, "no route");
    EXPECT_TRUE(r.has_error());
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "no route");
    EXPECT_EQ(r.error().code, Error::Code::DiscoveryFailed);
}

TEST(ResultTest, ValueOrReturnsFallbackOnError) {
    auto r = Result<std::string>::err(Error{Error::Code::NotReady, "busy"});
    EXPECT_EQ(r.value_or("fallback"), "fallback");

    auto ok = Result<std::string>::ok("value");
    EXPECT_EQ(ok.value_or("fallback"), "value");
}

TEST(ResultTest, MoveOnlyValue) {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    ASSERT_TRUE(r.has_value());
    std::unique_ptr<int> p = std::move(r).value();
    EXPECT_EQ(*p, 7);
}

TEST(ResultTest, MapTransformsValue) {
    auto r = Result<int>::ok(20).map([](int v) { return v * 2 + 2; });
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, MapKeepsError) {
    bool called = false;
    auto r = Result<int>::err(Error::Code::Unavailable, "empty")
                 .map([&](int v) {
                     called = true;
                     return std::to_string(v);
                 });
    EXPECT_FALSE(called);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Unavailable);
    EXPECT_EQ(r.error().message, "empty");
}

TEST(ResultTest, CodeToString) {
    EXPECT_STREQ(mesh_cpp::to_string(Error::Code::DiscoveryFailed),
                 "DiscoveryFailed");
    EXPECT_STREQ(mesh_cpp::to_string(Error::Code::NotReady), "NotReady");
    EXPECT_STREQ(mesh_cpp::to_string(Error::Code::InvalidConfig),
                 "InvalidConfig");
}
