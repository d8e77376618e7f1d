#pragma once

#include <filesystem>

#include "ClipboardTransport.hpp"

/**
 * @brief Payload stored in a single well-known file.
 *
 * Writes go to a sibling file that is then renamed over the target, so a
 * failed write leaves the previous payload intact.
 */
class TempFileTransport final : public ClipboardTransport
{
public:
    explicit TempFileTransport(std::filesystem::path filePath);

    [[nodiscard]] std::string_view transportName() const noexcept override;

    bool write(const std::string& text, ClipboardReport& report) override;
    bool read(std::string& text, ClipboardReport& report) override;

    [[nodiscard]] const std::filesystem::path& filePath() const noexcept
    {
        return m_filePath;
    }

private:
    std::filesystem::path m_filePath;
};
