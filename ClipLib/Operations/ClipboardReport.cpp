#include "ClipboardReport.hpp"

std::string_view statusName(ClipboardStatus status) noexcept
{
    switch (status)
    {
        case ClipboardStatus::Ok:
            return "Ok";
        case ClipboardStatus::ExtractionError:
            return "ExtractionError";
        case ClipboardStatus::TransportError:
            return "TransportError";
        case ClipboardStatus::UnsupportedVersion:
            return "UnsupportedVersion";
        case ClipboardStatus::MalformedReference:
            return "MalformedReference";
        case ClipboardStatus::ParseError:
            return "ParseError";
        case ClipboardStatus::NoTarget:
            return "NoTarget";
        case ClipboardStatus::SettingsError:
            return "SettingsError";
    }
    return "Unknown";
}
