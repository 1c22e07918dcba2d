#include "io/app_config.h"

#include "core/paths.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace
{
static void ReadInt(const json& j, const char* key, int& out)
{
    if (j.contains(key) && j[key].is_number_integer())
        out = j[key].get<int>();
}

static void ReadBool(const json& j, const char* key, bool& out)
{
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
}

static void ReadString(const json& j, const char* key, std::string& out)
{
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

static void FromJson(const json& j, AppConfig& out)
{
    // Defaults are already in out; only override what we recognize.
    ReadInt(j, "colour_count", out.colour_count);
    ReadInt(j, "quality", out.quality);
    ReadInt(j, "target_colours", out.target_colours);
    ReadInt(j, "min_colours", out.min_colours);
    ReadInt(j, "max_iterations", out.max_iterations);
    ReadInt(j, "intensity", out.intensity);
    ReadInt(j, "preview_scale", out.preview_scale);
    ReadBool(j, "dominant_background", out.dominant_background);
    ReadString(j, "templates_dir", out.templates_dir);
    ReadString(j, "vim_dir", out.vim_dir);
    ReadString(j, "shell_dir", out.shell_dir);
    ReadString(j, "swatch_mode", out.swatch_mode);

    std::string rule;
    ReadString(j, "background_rule", rule);
    if (rule == "quartic")
        out.background_rule = imagen::palette::BackgroundRule::Quartic;
    else if (rule == "linear")
        out.background_rule = imagen::palette::BackgroundRule::Linear;
    else if (!rule.empty())
        std::fprintf(stderr, "[config] unknown background_rule \"%s\" (ignored)\n", rule.c_str());

    std::string variant;
    ReadString(j, "variant", variant);
    if (!variant.empty() && !imagen::theme::ParseVariant(variant, out.variant))
        std::fprintf(stderr, "[config] unknown variant \"%s\" (ignored)\n", variant.c_str());
}

static bool ParseStream(std::istream& in, const std::string& label, AppConfig& out, imagen::Error& err)
{
    json j;
    try
    {
        in >> j;
    }
    catch (const std::exception& e)
    {
        return err.Fail(imagen::ErrorCode::ConfigInvalid, "Failed to parse config (" + label + "): " + e.what());
    }

    if (!j.is_object())
        return err.Fail(imagen::ErrorCode::ConfigInvalid, "Expected top-level JSON object in " + label);

    // Basic schema check (but keep it forgiving).
    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        const int ver = j["schema_version"].get<int>();
        if (ver != kAppConfigSchemaVersion)
        {
            std::fprintf(stderr, "[config] %s: unknown schema_version %d (ignored file)\n", label.c_str(), ver);
            return true;
        }
    }

    FromJson(j, out);
    return true;
}

static bool LoadFile(const std::string& path, AppConfig& out, imagen::Error& err)
{
    std::ifstream f(path);
    if (!f)
        return err.Fail(imagen::ErrorCode::ConfigInvalid, "Failed to open config file for reading: " + path);
    return ParseStream(f, path, out, err);
}
} // namespace

std::string GetAppConfigPath()
{
    return (fs::path(GetImagenConfigDir()) / "config.json").string();
}

bool ParseAppConfig(std::string_view json_text, AppConfig& out, imagen::Error& err)
{
    err.Clear();
    std::string text(json_text);
    std::istringstream in(text);
    return ParseStream(in, "<string>", out, err);
}

bool LoadAppConfig(const std::string& explicit_path, AppConfig& out, imagen::Error& err)
{
    err.Clear();

    if (!explicit_path.empty())
        return LoadFile(ExpandUserPath(explicit_path), out, err);

    std::error_code ec;
    const std::string user_path = GetAppConfigPath();
    if (fs::exists(user_path, ec) && !ec)
        return LoadFile(user_path, out, err);

    const std::string default_path = ImagenAssetPath("config.json");
    if (fs::exists(default_path, ec) && !ec)
        return LoadFile(default_path, out, err);

    // No user config and no bundled default; use hardcoded defaults.
    return true;
}

std::string ResolvedTemplatesDir(const AppConfig& cfg)
{
    if (!cfg.templates_dir.empty())
        return ExpandUserPath(cfg.templates_dir);
    return ImagenAssetPath("theme_templates");
}

imagen::palette::FilterOptions ToFilterOptions(const AppConfig& cfg)
{
    imagen::palette::FilterOptions o;
    o.target_count = cfg.target_colours;
    o.min_colours = cfg.min_colours;
    o.max_iterations = cfg.max_iterations;
    o.background_rule = cfg.background_rule;
    return o;
}

imagen::palette::QuantizeOptions ToQuantizeOptions(const AppConfig& cfg)
{
    imagen::palette::QuantizeOptions o;
    o.colour_count = cfg.colour_count;
    o.quality = cfg.quality;
    return o;
}
