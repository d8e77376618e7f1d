#pragma once

#include "ClipboardTransport.hpp"

/**
 * @brief Payload carried by the platform text clipboard (QClipboard).
 *
 * Requires a live QGuiApplication; without one every call fails with
 * TransportError.
 */
class OsClipboardTransport final : public ClipboardTransport
{
public:
    OsClipboardTransport() = default;

    [[nodiscard]] std::string_view transportName() const noexcept override;

    bool write(const std::string& text, ClipboardReport& report) override;
    bool read(std::string& text, ClipboardReport& report) override;
};
