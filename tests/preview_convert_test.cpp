#include <gtest/gtest.h>

#include "io/convert/preview_convert.h"
#include "io/image_loader.h"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
using imagen::colour::Rgb8;
using imagen::palette::ImageRgba;
using imagen::palette::PaletteAssignment;
using imagen::palette::Slot;
using imagen::palette::SlotAssignment;

namespace
{
ImageRgba Checker(int w, int h, Rgb8 a, Rgb8 b)
{
    ImageRgba img;
    img.width = w;
    img.height = h;
    img.pixels.resize((size_t)w * (size_t)h * 4u);
    for (int y = 0; y < h; ++y)
    {
        for (int x = 0; x < w; ++x)
        {
            // 2x2 blocks
            const Rgb8 c = (((x / 2) + (y / 2)) % 2 == 0) ? a : b;
            std::uint8_t* p = &img.pixels[((size_t)y * (size_t)w + (size_t)x) * 4u];
            p[0] = c.r;
            p[1] = c.g;
            p[2] = c.b;
            p[3] = 255;
        }
    }
    return img;
}

PaletteAssignment TwoColours()
{
    PaletteAssignment a;
    a.entries.push_back(SlotAssignment{Slot::Color00, Rgb8{0, 0, 0}, false});
    a.entries.push_back(SlotAssignment{Slot::Color07, Rgb8{250, 250, 250}, false});
    a.entries.push_back(SlotAssignment{Slot::Color21, Rgb8{0, 0, 0}, true});
    return a;
}
} // namespace

TEST(PreviewConvert, DownscaleAveragesBlocks)
{
    const ImageRgba src = Checker(4, 4, Rgb8{10, 20, 30}, Rgb8{50, 60, 70});
    ImageRgba out;
    std::string err;
    ASSERT_TRUE(preview_convert::Downscale(src, 2, out, err)) << err;
    ASSERT_EQ(out.width, 2);
    ASSERT_EQ(out.height, 2);
    EXPECT_EQ(out.pixels[0], 10);
    EXPECT_EQ(out.pixels[4], 50);
}

TEST(PreviewConvert, DownscaleNeverEmpty)
{
    const ImageRgba src = Checker(3, 3, Rgb8{100, 100, 100}, Rgb8{100, 100, 100});
    ImageRgba out;
    std::string err;
    ASSERT_TRUE(preview_convert::Downscale(src, 8, out, err)) << err;
    EXPECT_EQ(out.width, 1);
    EXPECT_EQ(out.height, 1);
    EXPECT_EQ(out.pixels[0], 100);
}

TEST(PreviewConvert, DownscaleHugeScaleAveragesWholeImage)
{
    const ImageRgba src = Checker(640, 480, Rgb8{0, 0, 0}, Rgb8{200, 100, 50});
    ImageRgba out;
    std::string err;
    ASSERT_TRUE(preview_convert::Downscale(src, 1000000, out, err)) << err;
    ASSERT_EQ(out.width, 1);
    ASSERT_EQ(out.height, 1);
    EXPECT_EQ(out.pixels[0], 100);
    EXPECT_EQ(out.pixels[1], 50);
    EXPECT_EQ(out.pixels[2], 25);
    EXPECT_EQ(out.pixels[3], 255);
}

TEST(PreviewConvert, DownscaleRejectsBadScale)
{
    ImageRgba out;
    std::string err;
    EXPECT_FALSE(preview_convert::Downscale(Checker(2, 2, Rgb8{}, Rgb8{}), 0, out, err));
    EXPECT_FALSE(err.empty());
}

TEST(PreviewConvert, NearestColourManhattan)
{
    const std::vector<Rgb8> palette = {{0, 0, 0}, {100, 0, 0}, {0, 100, 0}};
    EXPECT_EQ(preview_convert::NearestColour(Rgb8{90, 10, 0}, palette), (Rgb8{100, 0, 0}));
    // Equally near to both: the first listed wins.
    EXPECT_EQ(preview_convert::NearestColour(Rgb8{50, 50, 0}, std::vector<Rgb8>{{100, 0, 0}, {0, 100, 0}}),
              (Rgb8{100, 0, 0}));
}

TEST(PreviewConvert, UniqueColoursKeepsOrder)
{
    const auto u = preview_convert::UniqueColours(TwoColours());
    ASSERT_EQ(u.size(), 2u);
    EXPECT_EQ(u[0], (Rgb8{0, 0, 0}));
    EXPECT_EQ(u[1], (Rgb8{250, 250, 250}));
}

TEST(PreviewConvert, RenderUsesOnlyThemeColours)
{
    const ImageRgba src = Checker(8, 8, Rgb8{20, 20, 20}, Rgb8{230, 230, 230});
    preview_convert::Settings s;
    s.scale = 2;

    ImageRgba out;
    int distinct = 0;
    std::string err;
    ASSERT_TRUE(preview_convert::RenderPreview(src, TwoColours(), s, out, distinct, err)) << err;
    EXPECT_EQ(out.width, 4);
    EXPECT_EQ(out.height, 4);
    EXPECT_EQ(distinct, 2);
    EXPECT_EQ(out.pixels[0], 0);
    EXPECT_EQ(out.pixels[3], 255);
    EXPECT_EQ(out.pixels[4], 250);
}

TEST(PreviewConvert, RenderNeedsColours)
{
    ImageRgba out;
    int distinct = 0;
    std::string err;
    EXPECT_FALSE(preview_convert::RenderPreview(Checker(2, 2, Rgb8{}, Rgb8{}), PaletteAssignment{},
                                                preview_convert::Settings{}, out, distinct, err));
    EXPECT_FALSE(err.empty());
}

TEST(PreviewConvert, WritesReadablePng)
{
    const fs::path path = fs::temp_directory_path() / "imagen_preview_test.png";
    std::error_code ec;
    fs::remove(path, ec);

    const ImageRgba src = Checker(8, 8, Rgb8{20, 20, 20}, Rgb8{230, 230, 230});
    preview_convert::Settings s;
    s.scale = 4;

    int distinct = 0;
    std::string err;
    ASSERT_TRUE(preview_convert::WritePreviewPng(path.string(), src, TwoColours(), s, distinct, err)) << err;

    ImageRgba back;
    ASSERT_TRUE(image_loader::LoadImageAsRgba32(path.string(), back, err)) << err;
    EXPECT_EQ(back.width, 2);
    EXPECT_EQ(back.height, 2);
    fs::remove(path, ec);
}

TEST(PreviewConvert, LoadMissingImageFails)
{
    ImageRgba img;
    std::string err;
    EXPECT_FALSE(image_loader::LoadImageAsRgba32("/nonexistent/imagen_missing.png", img, err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(img.width, 0);
    EXPECT_TRUE(img.pixels.empty());
}
