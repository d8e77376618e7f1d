#include "TempFileTransport.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "ClipboardReport.hpp"

TempFileTransport::TempFileTransport(std::filesystem::path filePath) : m_filePath{std::move(filePath)}
{
}

std::string_view TempFileTransport::transportName() const noexcept
{
    return "TemporaryFile";
}

bool TempFileTransport::write(const std::string& text, ClipboardReport& report)
{
    std::error_code ec;

    const std::filesystem::path dir = m_filePath.parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            report.error(ClipboardStatus::TransportError,
                         "cannot create directory " + dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::filesystem::path tmpPath = m_filePath;
    tmpPath += ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            report.error(ClipboardStatus::TransportError, "cannot open " + tmpPath.string() + " for writing");
            return false;
        }

        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        if (!out)
        {
            std::filesystem::remove(tmpPath, ec);
            report.error(ClipboardStatus::TransportError, "failed writing " + tmpPath.string());
            return false;
        }
    }

    std::filesystem::rename(tmpPath, m_filePath, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        report.error(ClipboardStatus::TransportError,
                     "cannot replace " + m_filePath.string() + ": " + ec.message());
        return false;
    }

    report.info("Payload written to " + m_filePath.string());
    return true;
}

bool TempFileTransport::read(std::string& text, ClipboardReport& report)
{
    std::ifstream in(m_filePath, std::ios::binary);
    if (!in.is_open())
    {
        report.error(ClipboardStatus::TransportError, "no clipboard payload at " + m_filePath.string());
        return false;
    }

    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
    {
        report.error(ClipboardStatus::TransportError, "failed reading " + m_filePath.string());
        return false;
    }

    text = std::move(content);
    return true;
}
