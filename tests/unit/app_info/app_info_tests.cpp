#include <gtest/gtest.h>

#include "mm/app_info.hpp"

#include <algorithm>
#include <stdexcept>

namespace
{

bool containsToolId(std::span<const mm::appinfo::ToolInfo> tools, std::string_view id)
{
    return std::any_of(tools.begin(), tools.end(), [&](const mm::appinfo::ToolInfo &info) {
        return info.id == id;
    });
}

} // namespace

TEST(AppInfo, ListsTheFixTool)
{
    auto tools = mm::appinfo::tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_TRUE(containsToolId(tools, "mm-fix"));
}

TEST(AppInfo, RequireToolReturnsMatchingExecutable)
{
    const auto &info = mm::appinfo::requireTool("mm-fix");
    EXPECT_EQ(info.id, "mm-fix");
    EXPECT_EQ(info.executable, "mm-fix");
    EXPECT_FALSE(info.usageSummary.empty());
    EXPECT_NE(info.usageSummary.find("mm-fix"), std::string_view::npos);
}

TEST(AppInfo, FindToolReturnsNullForUnknownId)
{
    EXPECT_EQ(mm::appinfo::findTool("mm-lint"), nullptr);
    EXPECT_NE(mm::appinfo::findTool("mm-fix"), nullptr);
}

TEST(AppInfo, RequireToolThrowsForUnknownId)
{
    EXPECT_THROW(mm::appinfo::requireTool("does-not-exist"), std::runtime_error);
}
