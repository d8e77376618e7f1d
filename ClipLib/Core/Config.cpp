#include "Config.hpp"

#include <string>

#include "ClipboardReport.hpp"
#include "OsClipboardTransport.hpp"
#include "TempFileTransport.hpp"

namespace config
{

    void registerTransports(ItemFactory<ClipboardTransport>& factory)
    {
        factory.registerItem(std::string(transportModeName(TransportMode::TemporaryFile)),
                             []() { return std::make_unique<TempFileTransport>(ClipboardSettings::tempFilePath()); });
        factory.registerItem(std::string(transportModeName(TransportMode::OSClipboard)),
                             &ItemFactory<ClipboardTransport>::createItemType<OsClipboardTransport>);
    }

    std::unique_ptr<ClipboardTransport> createTransport(const ClipboardSettings& settings, ClipboardReport& report)
    {
        ItemFactory<ClipboardTransport> factory;
        registerTransports(factory);

        const std::string name = std::string(transportModeName(settings.transportMode));
        auto              transport = factory.createItem(name);
        if (!transport)
            report.error(ClipboardStatus::TransportError, "no clipboard transport named " + name);
        return transport;
    }

} // namespace config
