#pragma once

#include <string>
#include <string_view>

struct ClipboardReport;

/**
 * @brief Opaque carrier of one text payload between applications.
 *
 * write() replaces the whole payload; read() returns the last one written.
 * Failures are reported as TransportError.
 */
class ClipboardTransport
{
public:
    virtual ~ClipboardTransport() = default;

    /// @return Display name, e.g. "TemporaryFile".
    [[nodiscard]] virtual std::string_view transportName() const noexcept = 0;

    virtual bool write(const std::string& text, ClipboardReport& report) = 0;

    virtual bool read(std::string& text, ClipboardReport& report) = 0;
};
