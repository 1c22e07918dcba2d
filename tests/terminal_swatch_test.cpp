#include <gtest/gtest.h>

#include "io/terminal_swatch.h"

#include <string>
#include <vector>

using imagen::colour::Rgb8;
using imagen::palette::PaletteAssignment;
using imagen::palette::Slot;
using imagen::palette::SlotAssignment;

TEST(TerminalSwatch, TrueColourEscape)
{
    const std::string s = terminal_swatch::Swatch(Rgb8{1, 2, 3}, "hi", terminal_swatch::Mode::TrueColour);
    EXPECT_EQ(s, "\x1B[38;2;1;2;3m\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88 hi\x1B[0m");
}

TEST(TerminalSwatch, Xterm256Escape)
{
    const std::string s = terminal_swatch::Swatch(Rgb8{255, 0, 0}, "red", terminal_swatch::Mode::Xterm256);
    EXPECT_EQ(s.rfind("\x1B[38;5;196m", 0), 0u);
    EXPECT_NE(s.find(" red\x1B[0m"), std::string::npos);
}

TEST(TerminalSwatch, ParseMode)
{
    terminal_swatch::Mode m = terminal_swatch::Mode::Xterm256;
    ASSERT_TRUE(terminal_swatch::ParseMode("truecolour", m));
    EXPECT_EQ(m, terminal_swatch::Mode::TrueColour);
    ASSERT_TRUE(terminal_swatch::ParseMode("xterm256", m));
    EXPECT_EQ(m, terminal_swatch::Mode::Xterm256);
    ASSERT_TRUE(terminal_swatch::ParseMode("truecolor", m));
    EXPECT_EQ(m, terminal_swatch::Mode::TrueColour);
    EXPECT_TRUE(terminal_swatch::ParseMode("auto", m));
    EXPECT_FALSE(terminal_swatch::ParseMode("sixel", m));
}

TEST(TerminalSwatch, AssignmentLines)
{
    PaletteAssignment a;
    a.entries.push_back(SlotAssignment{Slot::Color00, Rgb8{10, 10, 10}, false});
    a.entries.push_back(SlotAssignment{Slot::Color21, Rgb8{10, 10, 10}, true});

    const std::string out = terminal_swatch::FormatAssignment(a, terminal_swatch::Mode::TrueColour);
    EXPECT_NE(out.find("(10, 10, 10) -> color00\x1B[0m\n"), std::string::npos);
    EXPECT_NE(out.find("(10, 10, 10) -> color21 (reused)\x1B[0m\n"), std::string::npos);
}

TEST(TerminalSwatch, PaletteSortedDarkestFirst)
{
    const std::vector<Rgb8> palette = {{200, 200, 200}, {0, 0, 0}, {100, 100, 100}};
    const std::string out = terminal_swatch::FormatPalette(palette, terminal_swatch::Mode::TrueColour);

    const auto black = out.find("(0, 0, 0)");
    const auto grey = out.find("(100, 100, 100)");
    const auto light = out.find("(200, 200, 200)");
    ASSERT_NE(black, std::string::npos);
    EXPECT_LT(black, grey);
    EXPECT_LT(grey, light);
}
