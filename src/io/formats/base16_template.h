#pragma once

#include "core/error.h"
#include "core/palette/slot_assigner.h"
#include "core/theme_builder.h"

#include <string>
#include <string_view>

// Base16 theme templates (flat text substitution).
//
// Tokens:
//   __theme_name__ / __theme__name__   theme name (no "base16-" prefix)
//   __colorNN__                        hex, channels joined by the template's separator
//   __hashed_colorNN__                 "#rrggbb"
//
// Unknown tokens, and slots missing from the assignment, are left verbatim.
namespace formats::base16
{
enum class Target
{
    Vim,   // separator ""  -> "1d1f21"
    Shell, // separator "/" -> "1d/1f/21"
};

std::string_view Separator(Target t);
const char* TemplateFileName(Target t); // "vim.txt" / "shell.txt"

std::string RenderTemplate(std::string_view text,
                           std::string_view theme_name,
                           const imagen::palette::PaletteAssignment& assignment,
                           std::string_view separator);

struct SaveOptions
{
    bool        vim = true;
    bool        shell = true;
    std::string vim_dir = ".";   // writes <vim_dir>/colors/base16-<name>.vim
    std::string shell_dir = "."; // writes <shell_dir>/scripts/base16-<name>.sh
    std::string templates_dir;   // holds vim.txt and shell.txt
};

struct SavedFiles
{
    std::string vim_path;   // empty when not written
    std::string shell_path; // empty when not written
};

// Renders the selected targets and writes them, creating directories as needed.
bool SaveTheme(const imagen::theme::Theme& theme,
               const SaveOptions& options,
               SavedFiles& out,
               imagen::Error& err);
} // namespace formats::base16
