#include <gtest/gtest.h>

#include "core/palette/slot_catalog.h"

#include <climits>
#include <string_view>
#include <vector>

using namespace imagen::palette;
using imagen::Error;
using imagen::ErrorCode;

TEST(SlotLabel, RoundTripsEverySlot)
{
    for (int i = 0; i < kSlotCount; ++i)
    {
        Slot s;
        ASSERT_TRUE(ParseSlotLabel(SlotLabel((Slot)i), s));
        EXPECT_EQ((int)s, i);
    }
    EXPECT_STREQ(SlotLabel(Slot::Color08), "color08");
}

TEST(SlotLabel, RejectsUnknown)
{
    Slot s;
    EXPECT_FALSE(ParseSlotLabel("color22", s));
    EXPECT_FALSE(ParseSlotLabel("colour00", s));
}

TEST(Prominence, SingleHue)
{
    const std::vector<std::string_view> red = {"red"};
    int v = 0;
    Error err;
    ASSERT_TRUE(Prominence(Rgb8{200, 50, 50}, red, v, err));
    EXPECT_EQ(v, 150);
    ASSERT_TRUE(Prominence(Rgb8{50, 50, 200}, red, v, err));
    EXPECT_EQ(v, -150);
}

TEST(Prominence, TwoHuesUseWeakestMargin)
{
    const std::vector<std::string_view> yellow = {"red", "green"};
    int v = 0;
    Error err;
    ASSERT_TRUE(Prominence(Rgb8{200, 180, 30}, yellow, v, err));
    EXPECT_EQ(v, 150);
}

TEST(Prominence, RejectsBadSelections)
{
    int v = 0;
    Error err;

    const std::vector<std::string_view> bad = {"purple"};
    EXPECT_FALSE(Prominence(Rgb8{1, 2, 3}, bad, v, err));
    EXPECT_EQ(err.code, ErrorCode::InvalidHueSelection);

    const std::vector<std::string_view> none;
    EXPECT_FALSE(Prominence(Rgb8{1, 2, 3}, none, v, err));
    EXPECT_EQ(err.code, ErrorCode::InvalidHueSelection);

    const std::vector<std::string_view> all = {"red", "green", "blue"};
    EXPECT_FALSE(Prominence(Rgb8{1, 2, 3}, all, v, err));
    EXPECT_EQ(err.code, ErrorCode::InvalidHueSelection);

    EXPECT_EQ(Prominence(Rgb8{1, 2, 3}, HueSet{}), INT_MIN);
}

TEST(Score, Metrics)
{
    const Rgb8 c{200, 30, 100};
    EXPECT_EQ(Score(Metric::Dark, c), -330);
    EXPECT_EQ(Score(Metric::Light, c), 330);
    EXPECT_EQ(Score(Metric::Red, c), 100);
    EXPECT_EQ(Score(Metric::Green, c), -170);
    EXPECT_EQ(Score(Metric::Blue, c), -100);
    EXPECT_EQ(Score(Metric::Magenta, c), 70);
    EXPECT_EQ(Score(Metric::Yellow, c), -70);
    EXPECT_EQ(Score(Metric::Cyan, c), -170);
}

TEST(Score, MetricNames)
{
    EXPECT_STREQ(MetricName(Metric::Dark), "dark");
    EXPECT_STREQ(MetricName(Metric::Magenta), "magenta");
}

TEST(AssignmentOrder, SixteenUniqueSlotsBackgroundFirst)
{
    for (Tone tone : {Tone::Dark, Tone::Light})
    {
        const auto order = AssignmentOrder(tone);
        ASSERT_EQ(order.size(), 16u);
        EXPECT_EQ(order[0].slot, Slot::Color00);
        EXPECT_EQ(order[1].slot, Slot::Color07);
        EXPECT_EQ(order[15].slot, Slot::Color08);
    }
    EXPECT_EQ(AssignmentOrder(Tone::Dark)[0].metric, Metric::Dark);
    EXPECT_EQ(AssignmentOrder(Tone::Light)[0].metric, Metric::Light);
}

TEST(AssignmentOrder, ExtendedSlotsFollowBackgroundMetric)
{
    const auto dark = AssignmentOrder(Tone::Dark);
    const auto light = AssignmentOrder(Tone::Light);
    for (std::size_t i = 8; i < 16; ++i)
    {
        EXPECT_EQ(dark[i].metric, Metric::Dark);
        EXPECT_EQ(light[i].metric, Metric::Light);
    }
}

TEST(ReuseRules, ExtendedSlots)
{
    const ReuseRule* r08 = ReuseRuleFor(Slot::Color08);
    ASSERT_NE(r08, nullptr);
    EXPECT_EQ(r08->kind, ReuseKind::Select);
    EXPECT_EQ(r08->metric, Metric::Dark);
    EXPECT_EQ(r08->pick, Pick::Lowest);
    EXPECT_EQ(r08->sources.size(), 6u);

    const ReuseRule* r19 = ReuseRuleFor(Slot::Color19);
    ASSERT_NE(r19, nullptr);
    EXPECT_EQ(r19->kind, ReuseKind::Copy);
    ASSERT_EQ(r19->sources.size(), 1u);
    EXPECT_EQ(r19->sources[0], Slot::Color04);

    EXPECT_EQ(ReuseRuleFor(Slot::Color00), nullptr);
    EXPECT_EQ(ReuseRuleFor(Slot::Color09), nullptr);
}

TEST(ValidateSlotCatalog, BothTonesAreConsistent)
{
    Error err;
    EXPECT_TRUE(ValidateSlotCatalog(Tone::Dark, err)) << err.message;
    EXPECT_TRUE(ValidateSlotCatalog(Tone::Light, err)) << err.message;
}
