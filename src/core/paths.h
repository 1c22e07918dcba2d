#pragma once

#include <string>

// Returns the base config directory used by imagen.
//
// $XDG_CONFIG_HOME/imagen, else $HOME/.config/imagen, else ".".
std::string GetImagenConfigDir();

// Returns the base assets directory used by imagen.
//
// Defaults to "<config_dir>/assets" where config_dir is returned by GetImagenConfigDir().
std::string GetImagenAssetsDir();

// Returns the read-only assets directory shipped with the install.
//
// $IMAGEN_DATA_DIR if set, else "<prefix>/share/imagen/assets" as configured at build time.
std::string GetImagenDataDir();

// Resolves a relative path within the assets.
// The user's "<assets_dir>/<relative>" wins when it exists, then "<data_dir>/<relative>".
// If neither exists the user path is returned so error messages point at it.
// Example: ImagenAssetPath("theme_templates") -> "<assets_dir>/theme_templates"
std::string ImagenAssetPath(const std::string& relative);

// Expands a leading "~" or "~/" using $HOME. Other paths are returned unchanged.
std::string ExpandUserPath(const std::string& path);
