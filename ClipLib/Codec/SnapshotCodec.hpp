#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "MeshSnapshot.hpp"

struct ClipboardReport;

/**
 * @brief Versioned JSON encoding of MeshSnapshot.
 *
 * Decoding validates everything before touching the output snapshot, so a
 * failed decode leaves it unchanged. Unknown fields are ignored; missing
 * optional sections decode as empty.
 */
class SnapshotCodec
{
public:
    /// Value of the top-level "format" tag.
    static constexpr std::string_view kFormatTag = "CPMF";

    /// Schema versions decode() accepts.
    static constexpr std::array<int32_t, 1> kSupportedVersions = {1};

    /// @param indent Spaces per nesting level; negative writes compact JSON.
    explicit SnapshotCodec(int indent = -1) noexcept;

    [[nodiscard]] std::string encode(const MeshSnapshot& snapshot) const;

    /**
     * @brief Parse and validate a payload.
     *
     * Errors are reported as ParseError, UnsupportedVersion or MalformedReference.
     * @return True and @p out assigned on success.
     */
    bool decode(std::string_view text, MeshSnapshot& out, ClipboardReport& report) const;

    static bool supportedVersion(int64_t version) noexcept;

private:
    int m_indent;
};
