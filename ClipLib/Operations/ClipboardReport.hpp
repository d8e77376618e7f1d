#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Outcome category of a clipboard operation or of a single message.
 */
enum class ClipboardStatus
{
    Ok,
    ExtractionError,    ///< Host returned unsupported/inconsistent data (absorbed).
    TransportError,     ///< Payload could not be written or read.
    UnsupportedVersion, ///< Payload schemaVersion is not in the allow-list.
    MalformedReference, ///< Payload references an element that does not exist.
    ParseError,         ///< Payload is not JSON or has wrongly typed fields.
    NoTarget,           ///< No mesh item to operate on.
    SettingsError       ///< Settings file could not be read or written.
};

/**
 * @brief Single informational/warning/error message produced by an operation.
 */
struct ClipboardMessage
{
    enum class Type
    {
        Info,
        Warning,
        Error
    };

    Type            type{};
    ClipboardStatus code{ClipboardStatus::Ok};
    std::string     text;
};

/**
 * @brief Aggregate report for one Copy/Cut/Paste/New-Mesh operation.
 *
 * The first error decides the final status; warnings never change it.
 */
struct ClipboardReport
{
    ClipboardStatus               status{ClipboardStatus::Ok};
    std::vector<ClipboardMessage> messages{};

    void info(std::string msg)
    {
        messages.push_back(ClipboardMessage{ClipboardMessage::Type::Info, ClipboardStatus::Ok, std::move(msg)});
    }

    void warning(std::string msg)
    {
        messages.push_back(ClipboardMessage{ClipboardMessage::Type::Warning, ClipboardStatus::Ok, std::move(msg)});
    }

    /// Warning that carries a category, e.g. a skipped element during extraction.
    void warning(ClipboardStatus code, std::string msg)
    {
        messages.push_back(ClipboardMessage{ClipboardMessage::Type::Warning, code, std::move(msg)});
    }

    void error(ClipboardStatus code, std::string msg)
    {
        messages.push_back(ClipboardMessage{ClipboardMessage::Type::Error, code, std::move(msg)});
        if (status == ClipboardStatus::Ok)
        {
            status = code;
        }
    }

    [[nodiscard]] bool ok() const noexcept
    {
        return status == ClipboardStatus::Ok;
    }

    [[nodiscard]] bool hasWarnings() const
    {
        for (const ClipboardMessage& m : messages)
        {
            if (m.type == ClipboardMessage::Type::Warning)
            {
                return true;
            }
        }
        return false;
    }

    /// @return Number of messages (of any type) carrying the given category.
    [[nodiscard]] size_t count(ClipboardStatus code) const
    {
        size_t n = 0;
        for (const ClipboardMessage& m : messages)
        {
            if (m.code == code)
            {
                ++n;
            }
        }
        return n;
    }
};

/// @return Stable display name of a status, e.g. "MalformedReference".
std::string_view statusName(ClipboardStatus status) noexcept;
