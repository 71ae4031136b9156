#include <gtest/gtest.h>

#include "selector.hpp"

namespace {

std::vector<std::string> numbered(const int n) {
    std::vector<std::string> items;
    for (int i = 0; i < n; ++i) items.push_back(fmt::format("item_{:02}", i));
    return items;
}

} // namespace

TEST(FuzzySelectorTest, FilterKeepsSourceOrderAndClampsCursor) {
    FuzzySelector selector({"alpha_target", "beta_target", "alpha_other"});
    selector.set_filter("alpha");
    EXPECT_EQ(selector.filtered(), (std::vector<std::string>{"alpha_target", "alpha_other"}));

    selector.move_down();
    EXPECT_EQ(selector.cursor(), 1u);
    selector.move_down();
    EXPECT_EQ(selector.cursor(), 1u);
    EXPECT_EQ(selector.selected(), "alpha_other");

    selector.move_up();
    selector.move_up();
    EXPECT_EQ(selector.cursor(), 0u);
    EXPECT_EQ(selector.selected(), "alpha_target");
}

TEST(FuzzySelectorTest, EmptyFilterIsIdentity) {
    const std::vector<std::string> items{"zeta", "alpha", "mid"};
    FuzzySelector selector(items);
    EXPECT_EQ(selector.filtered(), items);
    selector.set_filter("   ");
    EXPECT_EQ(selector.filtered(), items);
    EXPECT_EQ(FuzzySelector::filter("", items), items);
}

TEST(FuzzySelectorTest, TokensAreAndedAndCaseInsensitive) {
    const std::vector<std::string> items{"Generate_Client", "generate_server", "client_lib", "gen_docs"};
    EXPECT_EQ(FuzzySelector::filter("GEN client", items), (std::vector<std::string>{"Generate_Client"}));
    EXPECT_EQ(FuzzySelector::filter("gen", items),
              (std::vector<std::string>{"Generate_Client", "generate_server", "gen_docs"}));
    EXPECT_TRUE(FuzzySelector::filter("nothing", items).empty());
}

TEST(FuzzySelectorTest, FilteredIsSubsequenceOfSource) {
    const auto items = numbered(40);
    const auto result = FuzzySelector::filter("1", items);
    size_t pos = 0;
    for (const auto& r : result) {
        const auto it = std::find(items.begin() + static_cast<long>(pos), items.end(), r);
        ASSERT_NE(it, items.end()) << r;
        pos = static_cast<size_t>(it - items.begin()) + 1;
    }
}

TEST(FuzzySelectorTest, ChangingFilterOrSourceResetsCursor) {
    FuzzySelector selector(numbered(10));
    selector.move_down();
    selector.move_down();
    ASSERT_EQ(selector.cursor(), 2u);

    selector.set_filter("item");
    EXPECT_EQ(selector.cursor(), 0u);

    selector.move_down();
    selector.set_source({"item_a", "other"});
    EXPECT_EQ(selector.cursor(), 0u);
    EXPECT_EQ(selector.filter_text(), "item");
    EXPECT_EQ(selector.count(), 1u);
    EXPECT_EQ(selector.total_count(), 2u);
}

TEST(FuzzySelectorTest, NoMatchHasNoSelection) {
    FuzzySelector selector({"a", "b"});
    selector.set_filter("zzz");
    EXPECT_EQ(selector.count(), 0u);
    EXPECT_FALSE(selector.selected().has_value());
    selector.move_down();
    selector.move_up();
    EXPECT_EQ(selector.cursor(), 0u);
    EXPECT_TRUE(selector.viewport(10).empty());
}

TEST(FuzzySelectorTest, ViewportShowsEverythingWhenItFits) {
    FuzzySelector selector(numbered(5));
    selector.move_down();
    const auto rows = selector.viewport(10);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows.front().index, 0u);
    EXPECT_TRUE(rows[1].selected);
    EXPECT_FALSE(rows[0].selected);
}

TEST(FuzzySelectorTest, ViewportCentersCursor) {
    FuzzySelector selector(numbered(100));
    for (int i = 0; i < 50; ++i) selector.move_down();

    const auto rows = selector.viewport(10);
    ASSERT_EQ(rows.size(), 10u);
    EXPECT_EQ(rows.front().index, 45u);
    EXPECT_EQ(rows.back().index, 54u);
    EXPECT_EQ(rows[5].item, "item_50");
    EXPECT_TRUE(rows[5].selected);
}

TEST(FuzzySelectorTest, ViewportClampsAtEnds) {
    FuzzySelector selector(numbered(100));
    auto rows = selector.viewport(10);
    EXPECT_EQ(rows.front().index, 0u);
    EXPECT_TRUE(rows.front().selected);

    for (int i = 0; i < 200; ++i) selector.move_down();
    EXPECT_EQ(selector.cursor(), 99u);
    rows = selector.viewport(10);
    ASSERT_EQ(rows.size(), 10u);
    EXPECT_EQ(rows.front().index, 90u);
    EXPECT_EQ(rows.back().index, 99u);
    EXPECT_TRUE(rows.back().selected);
}

TEST(FuzzySelectorTest, ViewportAlwaysContainsCursor) {
    FuzzySelector selector(numbered(37));
    for (int step = 0; step < 37; ++step) {
        for (const int height : {1, 2, 7, 36, 37, 50}) {
            const auto rows = selector.viewport(height);
            ASSERT_LE(rows.size(), static_cast<size_t>(height));
            ASSERT_EQ(std::ranges::count_if(rows, [](const auto& r) { return r.selected; }), 1)
                << "cursor " << selector.cursor() << " height " << height;
        }
        selector.move_down();
    }
}

TEST(FuzzySelectorTest, NonPositiveHeightYieldsNothing) {
    const FuzzySelector selector(numbered(3));
    EXPECT_TRUE(selector.viewport(0).empty());
    EXPECT_TRUE(selector.viewport(-3).empty());
}
