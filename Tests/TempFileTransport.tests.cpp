#include "TempFileTransport.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "ClipboardReport.hpp"
#include "TestHelpers.hpp"

using namespace cliptest;

TEST(TempFileTransport, read_returns_the_last_payload_written)
{
    TempPath          dir("transport_roundtrip");
    TempFileTransport transport(dir.path() / "nested" / "clip.json");

    ClipboardReport report;
    ASSERT_TRUE(transport.write("first", report));
    ASSERT_TRUE(transport.write("second payload", report));

    std::string text;
    ASSERT_TRUE(transport.read(text, report));
    EXPECT_EQ(text, "second payload");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(transport.transportName(), "TemporaryFile");
}

TEST(TempFileTransport, no_sibling_file_is_left_behind)
{
    TempPath          dir("transport_sibling");
    TempFileTransport transport(dir.path() / "clip.json");

    ClipboardReport report;
    ASSERT_TRUE(transport.write("payload", report));

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "clip.json"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "clip.json.tmp"));
}

TEST(TempFileTransport, reading_a_missing_file_is_a_transport_error)
{
    TempPath          dir("transport_missing");
    TempFileTransport transport(dir.path() / "absent.json");

    std::string     text = "unchanged";
    ClipboardReport report;
    EXPECT_FALSE(transport.read(text, report));
    EXPECT_EQ(report.status, ClipboardStatus::TransportError);
    EXPECT_EQ(text, "unchanged");
}

TEST(TempFileTransport, failed_write_keeps_the_previous_payload)
{
    TempPath dir("transport_failed_write");
    std::filesystem::create_directories(dir.path());

    // A directory occupying the sibling path makes the write fail
    const std::filesystem::path target = dir.path() / "clip.json";
    {
        std::ofstream out(target);
        out << "previous";
    }
    std::filesystem::create_directories(dir.path() / "clip.json.tmp");

    TempFileTransport transport(target);
    ClipboardReport   report;
    EXPECT_FALSE(transport.write("next", report));
    EXPECT_EQ(report.status, ClipboardStatus::TransportError);

    std::string     text;
    ClipboardReport readReport;
    ASSERT_TRUE(transport.read(text, readReport));
    EXPECT_EQ(text, "previous");
}
