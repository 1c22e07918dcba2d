#pragma once

#include "core/error.h"
#include "core/palette/palette_filter.h"
#include "core/palette/quantize.h"
#include "core/theme_builder.h"

#include <string>
#include <string_view>

// Defaults for a theme build, read from a JSON file. Every key is optional; unknown keys and
// values of the wrong type are ignored.
//
// {
//   "schema_version": 1,
//   "colour_count": 50, "quality": 1,
//   "target_colours": 16, "min_colours": 8, "max_iterations": 50,
//   "background_rule": "quartic",
//   "variant": "auto", "intensity": 100, "dominant_background": false,
//   "templates_dir": "...", "vim_dir": ".", "shell_dir": ".",
//   "swatch_mode": "auto", "preview_scale": 4
// }
struct AppConfig
{
    // Candidate extraction
    int colour_count = 50;
    int quality = 1;

    // Palette filter
    int                                 target_colours = 16;
    int                                 min_colours = 8;
    int                                 max_iterations = 50;
    imagen::palette::BackgroundRule     background_rule = imagen::palette::BackgroundRule::Quartic;

    // Theme
    imagen::theme::Variant variant = imagen::theme::Variant::Auto;
    int                    intensity = 100;
    bool                   dominant_background = false;

    // Output
    std::string templates_dir; // empty => "<assets_dir>/theme_templates"
    std::string vim_dir = ".";
    std::string shell_dir = ".";
    std::string swatch_mode = "auto";
    int         preview_scale = 4;
};

static constexpr int kAppConfigSchemaVersion = 1;

// "<config_dir>/config.json"
std::string GetAppConfigPath();

// Applies the keys found in `json_text` on top of `out`.
bool ParseAppConfig(std::string_view json_text, AppConfig& out, imagen::Error& err);

// With an explicit path the file must exist and parse. Otherwise the user config is tried, then
// the bundled "<assets_dir>/config.json"; if neither exists the hard-coded defaults stand.
bool LoadAppConfig(const std::string& explicit_path, AppConfig& out, imagen::Error& err);

std::string ResolvedTemplatesDir(const AppConfig& cfg);

imagen::palette::FilterOptions   ToFilterOptions(const AppConfig& cfg);
imagen::palette::QuantizeOptions ToQuantizeOptions(const AppConfig& cfg);
