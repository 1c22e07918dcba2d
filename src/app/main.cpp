#include "core/error.h"
#include "core/palette/quantize.h"
#include "core/theme_builder.h"
#include "io/app_config.h"
#include "io/convert/preview_convert.h"
#include "io/formats/base16_template.h"
#include "io/image_loader.h"
#include "io/terminal_swatch.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " IMAGE_PATH THEME_NAME [options]\n"
              << "\n"
              << "Extracts a palette from an image and writes a Base16 theme\n"
              << "(colors/base16-<name>.vim and scripts/base16-<name>.sh).\n"
              << "\n"
              << "Options:\n"
              << "  -v, --variant <0|1>     0 = dark, 1 = light (default: detect from image)\n"
              << "  -i, --intensity <N>     Brightness window, 0..100 (default: 100)\n"
              << "  -p, --preview           Write <name>_preview.png instead of theme files\n"
              << "  --dominant-background   Use the image's dominant colour as the background\n"
              << "  --config <file>         Config file (default: <config_dir>/config.json)\n"
              << "  --templates <dir>       Directory holding vim.txt and shell.txt\n"
              << "  --vim-dir <dir>         Output root for the vim colorscheme (default: .)\n"
              << "  --shell-dir <dir>       Output root for the shell script (default: .)\n"
              << "  --no-vim                Skip the vim colorscheme\n"
              << "  --no-shell              Skip the shell script\n"
              << "  --preview-scale <N>     Preview downscale factor (default: 4)\n"
              << "  -h, --help              Show this help\n";
}

static bool ParseInt(std::string_view s, int& out)
{
    if (s.empty())
        return false;
    const std::string tmp(s);
    char* end = nullptr;
    const long v = std::strtol(tmp.c_str(), &end, 10);
    if (!end || *end != '\0' || v < -1000000 || v > 1000000)
        return false;
    out = (int)v;
    return true;
}

struct Args
{
    std::string image_path;
    std::string theme_name;
    std::string config_path;

    std::optional<imagen::theme::Variant> variant;
    std::optional<int>                    intensity;
    std::optional<int>                    preview_scale;
    std::optional<std::string>            templates_dir;
    std::optional<std::string>            vim_dir;
    std::optional<std::string>            shell_dir;

    bool preview = false;
    bool dominant_background = false;
    bool no_vim = false;
    bool no_shell = false;
};

// Command line wins over the config file.
static void ApplyArgs(const Args& a, AppConfig& cfg)
{
    if (a.variant)
        cfg.variant = *a.variant;
    if (a.intensity)
        cfg.intensity = *a.intensity;
    if (a.preview_scale)
        cfg.preview_scale = *a.preview_scale;
    if (a.templates_dir)
        cfg.templates_dir = *a.templates_dir;
    if (a.vim_dir)
        cfg.vim_dir = *a.vim_dir;
    if (a.shell_dir)
        cfg.shell_dir = *a.shell_dir;
    if (a.dominant_background)
        cfg.dominant_background = true;
}
} // namespace

int main(int argc, char** argv)
{
    Args args;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };
        auto need_int = [&](const char* opt) -> int {
            const std::string_view v = need(opt);
            int n = 0;
            if (!ParseInt(v, n))
            {
                std::cerr << "Invalid value for " << opt << ": " << v << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return n;
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "-v" || a == "--variant")
        {
            const std::string_view v = need("--variant");
            if (v == "0")
                args.variant = imagen::theme::Variant::Dark;
            else if (v == "1")
                args.variant = imagen::theme::Variant::Light;
            else
            {
                std::cerr << "Invalid variant: " << v << " (expected 0 or 1)\n";
                PrintUsage(argv[0]);
                return 2;
            }
        }
        else if (a == "-i" || a == "--intensity")
        {
            args.intensity = need_int("--intensity");
        }
        else if (a == "-p" || a == "--preview")
        {
            args.preview = true;
        }
        else if (a == "--dominant-background")
        {
            args.dominant_background = true;
        }
        else if (a == "--config")
        {
            args.config_path = std::string(need("--config"));
        }
        else if (a == "--templates")
        {
            args.templates_dir = std::string(need("--templates"));
        }
        else if (a == "--vim-dir")
        {
            args.vim_dir = std::string(need("--vim-dir"));
        }
        else if (a == "--shell-dir")
        {
            args.shell_dir = std::string(need("--shell-dir"));
        }
        else if (a == "--no-vim")
        {
            args.no_vim = true;
        }
        else if (a == "--no-shell")
        {
            args.no_shell = true;
        }
        else if (a == "--preview-scale")
        {
            args.preview_scale = need_int("--preview-scale");
        }
        else if (!a.empty() && a[0] == '-' && a.size() > 1)
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else
        {
            positional.push_back(a);
        }
    }

    if (positional.size() != 2)
    {
        std::cerr << "Expected IMAGE_PATH and THEME_NAME.\n";
        PrintUsage(argv[0]);
        return 2;
    }
    args.image_path = std::string(positional[0]);
    args.theme_name = std::string(positional[1]);

    if (args.no_vim && args.no_shell && !args.preview)
    {
        std::cerr << "Nothing to write: both --no-vim and --no-shell given.\n";
        return 2;
    }

    AppConfig cfg;
    imagen::Error err;
    if (!LoadAppConfig(args.config_path, cfg, err))
    {
        std::fprintf(stderr, "[config] %s\n", err.message.c_str());
        return 3;
    }
    ApplyArgs(args, cfg);

    terminal_swatch::Mode swatch_mode = terminal_swatch::Mode::Xterm256;
    if (!terminal_swatch::ParseMode(cfg.swatch_mode, swatch_mode))
    {
        std::fprintf(stderr, "[config] unknown swatch_mode \"%s\", using auto\n", cfg.swatch_mode.c_str());
        swatch_mode = terminal_swatch::DetectMode();
    }

    imagen::palette::ImageRgba image;
    std::string io_err;
    if (!image_loader::LoadImageAsRgba32(args.image_path, image, io_err))
    {
        std::fprintf(stderr, "[image] %s\n", io_err.c_str());
        return 3;
    }

    std::vector<imagen::colour::Rgb8> candidates;
    if (!imagen::palette::ExtractCandidates(image, ToQuantizeOptions(cfg), candidates, err))
    {
        std::fprintf(stderr, "[image] %s: %s\n", args.image_path.c_str(), err.message.c_str());
        return 3;
    }

    imagen::theme::ThemeOptions topts;
    topts.name = args.theme_name;
    topts.variant = cfg.variant;
    topts.intensity = cfg.intensity;
    topts.dominant_background = cfg.dominant_background;
    topts.filter = ToFilterOptions(cfg);

    imagen::theme::Theme theme;
    if (!imagen::theme::BuildTheme(candidates, topts, theme, err))
    {
        std::fprintf(stderr, "[theme] %s: %s\n", imagen::ErrorCodeName(err.code), err.message.c_str());
        return 1;
    }

    std::printf("%s (%s, %zu colours)\n",
                imagen::theme::ThemeFileStem(theme).c_str(),
                imagen::palette::ToneName(theme.tone),
                theme.palette.size());
    terminal_swatch::Print(stdout, terminal_swatch::FormatAssignment(theme.assignment, swatch_mode));

    if (args.preview)
    {
        preview_convert::Settings ps;
        ps.scale = cfg.preview_scale;
        const std::string out_path = theme.name + "_preview.png";
        int distinct = 0;
        if (!preview_convert::WritePreviewPng(out_path, image, theme.assignment, ps, distinct, io_err))
        {
            std::fprintf(stderr, "[preview] %s\n", io_err.c_str());
            return 1;
        }
        std::printf("Wrote %s (%d colours)\n", out_path.c_str(), distinct);
        return 0;
    }

    formats::base16::SaveOptions so;
    so.vim = !args.no_vim;
    so.shell = !args.no_shell;
    so.vim_dir = cfg.vim_dir;
    so.shell_dir = cfg.shell_dir;
    so.templates_dir = ResolvedTemplatesDir(cfg);

    formats::base16::SavedFiles saved;
    if (!formats::base16::SaveTheme(theme, so, saved, err))
    {
        std::fprintf(stderr, "[theme] %s: %s\n", imagen::ErrorCodeName(err.code), err.message.c_str());
        return 1;
    }
    if (!saved.vim_path.empty())
        std::printf("Wrote %s\n", saved.vim_path.c_str());
    if (!saved.shell_path.empty())
        std::printf("Wrote %s\n", saved.shell_path.c_str());
    return 0;
}
