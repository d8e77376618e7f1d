#pragma once

#include <iostream>

#include "ClipboardReport.hpp"

inline void dumpClipboardReport(const ClipboardReport& report, std::ostream& out = std::cerr)
{
    for (const ClipboardMessage& m : report.messages)
    {
        switch (m.type)
        {
            case ClipboardMessage::Type::Info:
                out << "[Clipboard][Info] ";
                break;
            case ClipboardMessage::Type::Warning:
                out << "[Clipboard][Warning] ";
                break;
            case ClipboardMessage::Type::Error:
                out << "[Clipboard][Error] ";
                break;
        }

        if (m.code != ClipboardStatus::Ok)
            out << statusName(m.code) << ": ";

        out << m.text << '\n';
    }

    if (report.status != ClipboardStatus::Ok)
    {
        out << "[Clipboard] Final status = " << statusName(report.status) << '\n';
    }
}
