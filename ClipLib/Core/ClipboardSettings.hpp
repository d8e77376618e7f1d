#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

struct ClipboardReport;

enum class TransportMode : uint8_t
{
    TemporaryFile,
    OSClipboard
};

std::string_view             transportModeName(TransportMode mode) noexcept;
std::optional<TransportMode> parseTransportMode(std::string_view name) noexcept;

/// User-facing clipboard configuration, persisted as a small JSON file.
/// The transport mode is the only setting.
struct ClipboardSettings
{
    TransportMode transportMode = TransportMode::TemporaryFile;

    /// Well-known payload file of the TemporaryFile transport.
    /// @return <system temp dir>/cpmf_clipboard.json
    static std::filesystem::path tempFilePath();

    /// @return $XDG_CONFIG_HOME/meshclip/settings.json, falling back to ~/.config and the temp dir.
    static std::filesystem::path defaultSettingsPath();
};

/**
 * @brief Read settings from @p path into @p settings.
 *
 * A missing file is not an error: defaults are kept. Keys other than
 * transportMode are ignored; an unknown transport mode is reported and
 * falls back to TemporaryFile.
 * @return False (SettingsError) only when the file exists but cannot be read or parsed.
 */
bool loadClipboardSettings(const std::filesystem::path& path, ClipboardSettings& settings, ClipboardReport& report);

/// Writes @p settings to @p path, creating parent directories. Failures are SettingsError.
bool saveClipboardSettings(const std::filesystem::path& path, const ClipboardSettings& settings,
                           ClipboardReport& report);
