#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

#ifndef IMAGEN_INSTALL_DATA_DIR
#define IMAGEN_INSTALL_DATA_DIR "/usr/local/share/imagen/assets"
#endif

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetImagenConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/imagen";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/imagen";

    // Last resort: current directory
    return ".";
}

std::string GetImagenAssetsDir()
{
    namespace fs = std::filesystem;
    return (fs::path(GetImagenConfigDir()) / "assets").string();
}

std::string GetImagenDataDir()
{
    const std::string env = EnvOrEmpty("IMAGEN_DATA_DIR");
    if (!env.empty())
        return env;
    return IMAGEN_INSTALL_DATA_DIR;
}

std::string ImagenAssetPath(const std::string& relative)
{
    namespace fs = std::filesystem;
    const fs::path user = relative.empty() ? fs::path(GetImagenAssetsDir()) : fs::path(GetImagenAssetsDir()) / relative;

    std::error_code ec;
    if (fs::exists(user, ec) && !ec)
        return user.string();

    const fs::path shipped = relative.empty() ? fs::path(GetImagenDataDir()) : fs::path(GetImagenDataDir()) / relative;
    if (fs::exists(shipped, ec) && !ec)
        return shipped.string();

    return user.string();
}

std::string ExpandUserPath(const std::string& path)
{
    if (path.empty() || path[0] != '~')
        return path;
    if (path.size() > 1 && path[1] != '/')
        return path; // "~user" forms are left alone

    const std::string home = EnvOrEmpty("HOME");
    if (home.empty())
        return path;
    return home + path.substr(1);
}
