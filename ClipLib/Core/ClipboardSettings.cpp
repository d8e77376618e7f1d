#include "ClipboardSettings.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

#include "ClipboardReport.hpp"

namespace
{
    constexpr const char* kTempFileName = "cpmf_clipboard.json";

    std::filesystem::path tempDirectory()
    {
        std::error_code             ec;
        const std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
        return ec ? std::filesystem::path{"."} : dir;
    }
} // namespace

std::string_view transportModeName(TransportMode mode) noexcept
{
    switch (mode)
    {
        case TransportMode::TemporaryFile:
            return "TemporaryFile";
        case TransportMode::OSClipboard:
            return "OSClipboard";
    }
    return "TemporaryFile";
}

std::optional<TransportMode> parseTransportMode(std::string_view name) noexcept
{
    if (name == "TemporaryFile")
        return TransportMode::TemporaryFile;
    if (name == "OSClipboard")
        return TransportMode::OSClipboard;
    return std::nullopt;
}

std::filesystem::path ClipboardSettings::tempFilePath()
{
    return tempDirectory() / kTempFileName;
}

std::filesystem::path ClipboardSettings::defaultSettingsPath()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path{xdg} / "meshclip" / "settings.json";

    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path{home} / ".config" / "meshclip" / "settings.json";

    return tempDirectory() / "meshclip_settings.json";
}

bool loadClipboardSettings(const std::filesystem::path& path, ClipboardSettings& settings, ClipboardReport& report)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;

    std::ifstream in(path);
    if (!in.is_open())
    {
        report.error(ClipboardStatus::SettingsError, "cannot open settings file " + path.string());
        return false;
    }

    const std::string    text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    const nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        report.error(ClipboardStatus::SettingsError, "settings file " + path.string() + " is not a JSON object");
        return false;
    }

    ClipboardSettings loaded = settings;

    if (const auto it = root.find("transportMode"); it != root.end())
    {
        const std::optional<TransportMode> mode =
            it->is_string() ? parseTransportMode(it->get<std::string>()) : std::nullopt;
        if (mode)
        {
            loaded.transportMode = *mode;
        }
        else
        {
            report.warning("unknown transportMode in " + path.string() + ", using TemporaryFile");
            loaded.transportMode = TransportMode::TemporaryFile;
        }
    }

    settings = std::move(loaded);
    return true;
}

bool saveClipboardSettings(const std::filesystem::path& path, const ClipboardSettings& settings,
                           ClipboardReport& report)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            report.error(ClipboardStatus::SettingsError,
                         "cannot create directory " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    nlohmann::json root;
    root["transportMode"] = std::string(transportModeName(settings.transportMode));

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        report.error(ClipboardStatus::SettingsError, "cannot open settings file " + path.string() + " for writing");
        return false;
    }

    out << root.dump(4) << '\n';
    out.close();
    if (!out)
    {
        report.error(ClipboardStatus::SettingsError, "failed writing settings file " + path.string());
        return false;
    }
    return true;
}
