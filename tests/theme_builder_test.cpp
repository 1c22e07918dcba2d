#include <gtest/gtest.h>

#include "core/theme_builder.h"

#include <vector>

using namespace imagen::theme;
using imagen::Error;
using imagen::ErrorCode;
using imagen::palette::Slot;
using imagen::palette::Tone;

namespace
{
// Dominant colour first, as ExtractCandidates produces it.
std::vector<Rgb8> DarkCandidates()
{
    return {
        {10, 10, 10},   {10, 10, 10},   {250, 250, 250}, {200, 30, 30},  {30, 200, 30},
        {30, 30, 200},  {200, 200, 30}, {200, 30, 200},  {30, 200, 200},
    };
}
} // namespace

TEST(ThemeName, Normalize)
{
    EXPECT_EQ(NormalizeThemeName("ocean"), "ocean");
    EXPECT_EQ(NormalizeThemeName("base16-ocean"), "ocean");
    EXPECT_EQ(NormalizeThemeName("  ocean \n"), "ocean");
    EXPECT_EQ(NormalizeThemeName("base16-"), "base16-");

    Theme t;
    t.name = "ocean";
    EXPECT_EQ(ThemeFileStem(t), "base16-ocean");
}

TEST(Variant, Parse)
{
    Variant v = Variant::Dark;
    ASSERT_TRUE(ParseVariant("auto", v));
    EXPECT_EQ(v, Variant::Auto);
    ASSERT_TRUE(ParseVariant("light", v));
    EXPECT_EQ(v, Variant::Light);
    EXPECT_FALSE(ParseVariant("dim", v));
    EXPECT_STREQ(VariantName(Variant::Dark), "dark");
}

TEST(ResolveTone, AutoDetectsDarkImage)
{
    Tone tone;
    BrightnessWindow w;
    ResolveTone(Rgb8{30, 30, 30}, Variant::Auto, 80, tone, w);
    EXPECT_EQ(tone, Tone::Dark);
    EXPECT_DOUBLE_EQ(w.lower, 30.0);
    EXPECT_NEAR(w.upper, 204.0, 1e-9);
}

TEST(ResolveTone, AutoDetectsLightImage)
{
    Tone tone;
    BrightnessWindow w;
    ResolveTone(Rgb8{200, 200, 200}, Variant::Auto, 80, tone, w);
    EXPECT_EQ(tone, Tone::Light);
    EXPECT_NEAR(w.lower, 51.0, 1e-9);
    EXPECT_DOUBLE_EQ(w.upper, 200.0);
}

TEST(ResolveTone, ExplicitVariants)
{
    Tone tone;
    BrightnessWindow w;

    ResolveTone(Rgb8{250, 250, 250}, Variant::Dark, 60, tone, w);
    EXPECT_EQ(tone, Tone::Dark);
    EXPECT_NEAR(w.lower, 102.0, 1e-9);
    EXPECT_DOUBLE_EQ(w.upper, 255.0);

    ResolveTone(Rgb8{0, 0, 0}, Variant::Light, 60, tone, w);
    EXPECT_EQ(tone, Tone::Light);
    EXPECT_DOUBLE_EQ(w.lower, 0.0);
    EXPECT_NEAR(w.upper, 153.0, 1e-9);
}

TEST(BrightnessWindow, InclusiveBoundsKeepOrder)
{
    const std::vector<Rgb8> in = {{90, 90, 90}, {10, 10, 10}, {30, 30, 30}, {60, 60, 60}};
    const auto out = ApplyBrightnessWindow(in, BrightnessWindow{30.0, 60.0});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (Rgb8{30, 30, 30}));
    EXPECT_EQ(out[1], (Rgb8{60, 60, 60}));
}

TEST(BuildTheme, DarkImage)
{
    ThemeOptions opts;
    opts.name = "base16-night";

    Theme theme;
    Error err;
    ASSERT_TRUE(BuildTheme(DarkCandidates(), opts, theme, err)) << err.message;
    EXPECT_EQ(theme.name, "night");
    EXPECT_EQ(theme.tone, Tone::Dark);
    EXPECT_TRUE(theme.degraded);
    EXPECT_EQ(theme.palette.size(), 8u);
    ASSERT_EQ(theme.assignment.entries.size(), 16u);
    EXPECT_EQ(*theme.assignment.Find(Slot::Color00), (Rgb8{10, 10, 10}));
    EXPECT_EQ(*theme.assignment.Find(Slot::Color07), (Rgb8{250, 250, 250}));
    EXPECT_EQ(*theme.assignment.Find(Slot::Color01), (Rgb8{200, 30, 30}));
}

TEST(BuildTheme, DominantBackground)
{
    std::vector<Rgb8> candidates = DarkCandidates();
    candidates[0] = Rgb8{40, 40, 40};

    ThemeOptions opts;
    opts.name = "dusk";
    opts.variant = Variant::Dark;
    opts.dominant_background = true;

    Theme theme;
    Error err;
    ASSERT_TRUE(BuildTheme(candidates, opts, theme, err)) << err.message;
    EXPECT_EQ(*theme.assignment.Find(Slot::Color00), (Rgb8{40, 40, 40}));

    opts.dominant_background = false;
    ASSERT_TRUE(BuildTheme(candidates, opts, theme, err)) << err.message;
    EXPECT_EQ(*theme.assignment.Find(Slot::Color00), (Rgb8{10, 10, 10}));
}

TEST(BuildTheme, ExplicitWindowOverridesVariant)
{
    ThemeOptions opts;
    opts.name = "narrow";
    opts.window = BrightnessWindow{200.0, 210.0};

    Theme theme;
    Error err;
    EXPECT_FALSE(BuildTheme(DarkCandidates(), opts, theme, err));
    EXPECT_EQ(err.code, ErrorCode::InsufficientDistinctColours);
}

TEST(BuildTheme, TooFewColours)
{
    const std::vector<Rgb8> candidates(12, Rgb8{10, 10, 10});
    ThemeOptions opts;
    opts.name = "flat";

    Theme theme;
    Error err;
    EXPECT_FALSE(BuildTheme(candidates, opts, theme, err));
    EXPECT_EQ(err.code, ErrorCode::InsufficientDistinctColours);
}

TEST(BuildTheme, RejectsBadArguments)
{
    Theme theme;
    Error err;

    ThemeOptions opts;
    opts.name = "  ";
    EXPECT_FALSE(BuildTheme(DarkCandidates(), opts, theme, err));
    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);

    opts.name = "ok";
    opts.intensity = 101;
    EXPECT_FALSE(BuildTheme(DarkCandidates(), opts, theme, err));
    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);

    opts.intensity = 100;
    EXPECT_FALSE(BuildTheme({}, opts, theme, err));
    EXPECT_EQ(err.code, ErrorCode::InsufficientDistinctColours);
}
