#include "OsClipboardTransport.hpp"

#include <QClipboard>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QString>

#include "ClipboardReport.hpp"

namespace
{
    QClipboard* systemClipboard(ClipboardReport& report)
    {
        if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance()))
        {
            report.error(ClipboardStatus::TransportError, "the OS clipboard needs a running GUI application");
            return nullptr;
        }

        QClipboard* clipboard = QGuiApplication::clipboard();
        if (!clipboard)
            report.error(ClipboardStatus::TransportError, "the OS clipboard is not available");
        return clipboard;
    }
} // namespace

std::string_view OsClipboardTransport::transportName() const noexcept
{
    return "OSClipboard";
}

bool OsClipboardTransport::write(const std::string& text, ClipboardReport& report)
{
    QClipboard* clipboard = systemClipboard(report);
    if (!clipboard)
        return false;

    clipboard->setText(QString::fromStdString(text), QClipboard::Clipboard);
    report.info("Payload written to the OS clipboard");
    return true;
}

bool OsClipboardTransport::read(std::string& text, ClipboardReport& report)
{
    QClipboard* clipboard = systemClipboard(report);
    if (!clipboard)
        return false;

    const QString content = clipboard->text(QClipboard::Clipboard);
    if (content.isEmpty())
    {
        report.error(ClipboardStatus::TransportError, "the OS clipboard holds no text");
        return false;
    }

    text = content.toStdString();
    return true;
}
