#pragma once

#include <memory>

#include "ClipboardSettings.hpp"
#include "ItemFactory.hpp"

class ClipboardTransport;
struct ClipboardReport;

namespace config
{

    /**
     * @brief Register the clipboard transports under their TransportMode names.
     *
     * The temporary file backend writes to ClipboardSettings::tempFilePath().
     *
     * Typical usage:
     * @code
     * ItemFactory<ClipboardTransport> transports;
     * registerTransports(transports);
     * auto transport = transports.createItem("TemporaryFile");
     * @endcode
     */
    void registerTransports(ItemFactory<ClipboardTransport>& factory);

    /**
     * @brief Create the transport selected by the settings.
     * @return The transport, or nullptr (reported as TransportError) if none is registered.
     */
    std::unique_ptr<ClipboardTransport> createTransport(const ClipboardSettings& settings, ClipboardReport& report);

} // namespace config
