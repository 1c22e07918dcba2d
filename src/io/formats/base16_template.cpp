#include "io/formats/base16_template.h"

#include "core/paths.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace formats::base16
{
using imagen::Error;
using imagen::ErrorCode;
using imagen::palette::PaletteAssignment;
using imagen::palette::Slot;

std::string_view Separator(Target t)
{
    return t == Target::Shell ? std::string_view("/") : std::string_view();
}

const char* TemplateFileName(Target t)
{
    return t == Target::Shell ? "shell.txt" : "vim.txt";
}

namespace
{
static bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Value for a token body (the text between the "__" delimiters), or false if unknown.
static bool ResolveToken(std::string_view token,
                         std::string_view theme_name,
                         const PaletteAssignment& assignment,
                         std::string_view separator,
                         std::string& out)
{
    if (token == "theme_name")
    {
        out = std::string(theme_name);
        return true;
    }

    bool hashed = false;
    if (StartsWith(token, "hashed_"))
    {
        hashed = true;
        token.remove_prefix(7);
    }

    Slot slot;
    if (!imagen::palette::ParseSlotLabel(token, slot))
        return false;
    const imagen::colour::Rgb8* c = assignment.Find(slot);
    if (!c)
        return false;

    out = hashed ? "#" + imagen::colour::ToHex(*c) : imagen::colour::ToHex(*c, separator);
    return true;
}

static bool ReadTextFile(const std::string& path, std::string& out, Error& err)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return err.Fail(ErrorCode::TemplateFailed, "Failed to open template: " + path);

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return err.Fail(ErrorCode::TemplateFailed, "Failed to read template: " + path);
    out = ss.str();
    return true;
}

static bool WriteTextFile(const fs::path& path, const std::string& text, Error& err)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
        return err.Fail(ErrorCode::WriteFailed,
                        "Failed to create directory " + path.parent_path().string() + ": " + ec.message());

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        return err.Fail(ErrorCode::WriteFailed, "Failed to open for writing: " + path.string());
    f << text;
    f.flush();
    if (!f)
        return err.Fail(ErrorCode::WriteFailed, "Failed to write: " + path.string());
    return true;
}

static bool RenderAndWrite(Target target,
                           const imagen::theme::Theme& theme,
                           const SaveOptions& options,
                           const fs::path& dest,
                           Error& err)
{
    std::string text;
    const std::string tpl = (fs::path(ExpandUserPath(options.templates_dir)) / TemplateFileName(target)).string();
    if (!ReadTextFile(tpl, text, err))
        return false;

    const std::string rendered = RenderTemplate(text, theme.name, theme.assignment, Separator(target));
    return WriteTextFile(dest, rendered, err);
}
} // namespace

std::string RenderTemplate(std::string_view text,
                           std::string_view theme_name,
                           const PaletteAssignment& assignment,
                           std::string_view separator)
{
    static constexpr std::string_view kShellName = "__theme__name__";

    std::string out;
    out.reserve(text.size() + text.size() / 4);

    std::size_t i = 0;
    while (i < text.size())
    {
        const std::size_t open = text.find("__", i);
        if (open == std::string_view::npos)
        {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, open - i));
        i = open;

        // The shell template spells its name token with a doubled separator.
        if (StartsWith(text.substr(i), kShellName))
        {
            out.append(theme_name);
            i += kShellName.size();
            continue;
        }

        const std::size_t close = text.find("__", i + 2);
        std::string value;
        if (close != std::string_view::npos &&
            ResolveToken(text.substr(i + 2, close - i - 2), theme_name, assignment, separator, value))
        {
            out += value;
            i = close + 2;
            continue;
        }

        // Not a token here; move one character on so "___color00__" still matches.
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

bool SaveTheme(const imagen::theme::Theme& theme, const SaveOptions& options, SavedFiles& out, Error& err)
{
    err.Clear();
    out = SavedFiles{};

    if (theme.assignment.entries.empty())
        return err.Fail(ErrorCode::InvalidArgument, "No colours designated");
    if (!options.vim && !options.shell)
        return err.Fail(ErrorCode::InvalidArgument, "Must select at least one of 'shell' or 'vim'");

    const std::string stem = imagen::theme::ThemeFileStem(theme);

    if (options.vim)
    {
        const fs::path dest = fs::path(ExpandUserPath(options.vim_dir)) / "colors" / (stem + ".vim");
        if (!RenderAndWrite(Target::Vim, theme, options, dest, err))
            return false;
        out.vim_path = dest.string();
    }

    if (options.shell)
    {
        const fs::path dest = fs::path(ExpandUserPath(options.shell_dir)) / "scripts" / (stem + ".sh");
        if (!RenderAndWrite(Target::Shell, theme, options, dest, err))
            return false;
        out.shell_path = dest.string();
    }
    return true;
}
} // namespace formats::base16
