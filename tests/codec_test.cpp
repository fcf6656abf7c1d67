// C++ Standard Library
#include <string>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <ts/query/codec.hpp>
#include <ts/query/error.hpp>
#include <ts/query/records.hpp>

using namespace ts::query;

namespace
{
    struct Raw
    {
        RecordRow row;
        static Raw from_row(const RecordRow& r)
        {
            return Raw{ r };
        }
    };
} // namespace

TEST(Escape, EscapesBackslashSpaceAndSlash)
{
    EXPECT_EQ(escape("a b"), "a\\sb");
    EXPECT_EQ(escape("a/b"), "a\\/b");
    EXPECT_EQ(escape("a\\b"), "a\\\\b");
    EXPECT_EQ(escape("plain"), "plain");
    EXPECT_EQ(escape(""), "");
}

TEST(Escape, BackslashIsEscapedFirst)
{
    // The backslashes inserted for ' ' and '/' must not be doubled again.
    EXPECT_EQ(escape("\\ /"), "\\\\\\s\\/");
}

TEST(Escape, UnescapeReversesEscape)
{
    for (const std::string s : { "", " ", "a b c", "x/y\\z", "\\\\s", "trailing\\", "/ \\ /", "s\\s" })
    {
        EXPECT_EQ(unescape(escape(s)), s) << s;
    }
}

TEST(Escape, UnescapeUnderstandsConsoleSequences)
{
    EXPECT_EQ(unescape("a\\pb"), "a|b");
    EXPECT_EQ(unescape("l1\\nl2"), "l1\nl2");
    EXPECT_EQ(unescape("\\t"), "\t");
    EXPECT_EQ(unescape("\\q"), "q");
    EXPECT_EQ(unescape("end\\"), "end\\");
}

TEST(Status, ParsesIdAndMessage)
{
    const auto status = parse_status_line("error id=1794 msg=not\\sconnected");
    EXPECT_EQ(status.code, 1794);
    EXPECT_EQ(status.message, "not connected");
    EXPECT_FALSE(status.ok());

    EXPECT_TRUE(parse_status_line("  error id=0 msg=ok\r").ok());
}

TEST(Status, MalformedLineIsProtocolError)
{
    for (const char* line : { "notify id=0", "error msg=ok", "error id=abc msg=ok", "error id=12x" })
    {
        try
        {
            (void)parse_status_line(line);
            ADD_FAILURE() << "no exception for " << line;
        }
        catch (const ProtocolError& e)
        {
            EXPECT_EQ(e.code(), errc::malformed_status) << line;
        }
    }
}

TEST(Status, MissingStatusLineIsProtocolError)
{
    try
    {
        (void)decode_status("clid=1 cid=2\n\r");
        FAIL() << "expected ProtocolError";
    }
    catch (const ProtocolError& e)
    {
        EXPECT_EQ(e.code(), errc::status_not_found);
    }
}

TEST(Status, NonZeroIdThrowsEvenAfterDataLines)
{
    try
    {
        (void)decode_status("clid=1 cid=2\n\rerror id=512 msg=invalid\\sclientID\n\r");
        FAIL() << "expected StatusError";
    }
    catch (const StatusError& e)
    {
        EXPECT_EQ(e.id(), 512);
        EXPECT_EQ(e.message(), "invalid clientID");
        EXPECT_TRUE(e.code().category() == status_category());
    }
}

TEST(Status, NotConnectedReply)
{
    try
    {
        (void)decode_status("error id=1794 msg=not\\sconnected\r\n");
        FAIL() << "expected StatusError";
    }
    catch (const StatusError& e)
    {
        EXPECT_EQ(e.id(), k_status_not_connected);
        EXPECT_EQ(e.message(), "not connected");
    }
}

TEST(Status, SuccessReturnsContent)
{
    const std::string content = "clid=1\n\rerror id=0 msg=ok\n\r";
    EXPECT_EQ(decode_status(content), content);
}

TEST(Status, HasStatusLineNeedsFullMarker)
{
    EXPECT_TRUE(has_status_line("data\n\rerror id=0 msg=ok\n\r"));
    EXPECT_FALSE(has_status_line("data\n\r"));
    EXPECT_FALSE(has_status_line("error "));
}

TEST(Rows, ParsesKeyValueTokensAndBareKeys)
{
    const auto row = parse_row("clid=5 client_nickname=Some\\sName client_description");
    EXPECT_EQ(row.at("clid"), "5");
    EXPECT_EQ(row.at("client_nickname"), "Some Name");
    EXPECT_EQ(row.at("client_description"), "");
    EXPECT_EQ(row.size(), 3u);
}

TEST(Rows, ValueMayContainEquals)
{
    const auto row = parse_row("msg=a=b");
    EXPECT_EQ(row.at("msg"), "a=b");
}

TEST(Rows, OneRecordPerSegmentInOrder)
{
    const auto rows = decode_rows<Raw>("a=1|a=2|a=3\n\rerror id=0 msg=ok\n\r");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows->size(), 3u);
    EXPECT_EQ(rows->at(0).row.at("a"), "1");
    EXPECT_EQ(rows->at(1).row.at("a"), "2");
    EXPECT_EQ(rows->at(2).row.at("a"), "3");
}

TEST(Rows, NoDataLineIsNullopt)
{
    EXPECT_FALSE(decode_rows<Raw>("error id=0 msg=ok\n\r"));
    EXPECT_FALSE(decode_rows<Raw>("\n\r\n\rerror id=0 msg=ok\n\r"));
}

TEST(Rows, ChannelListDecodes)
{
    const auto channels = decode_rows<Channel>(
        "cid=1 pid=0 channel_name=Lobby total_clients=3|cid=2 pid=0 channel_name=AFK total_clients=0\n"
        "error id=0 msg=ok\r\n");
    ASSERT_TRUE(channels);
    ASSERT_EQ(channels->size(), 2u);
    EXPECT_EQ(channels->at(0).name, "Lobby");
    EXPECT_EQ(channels->at(0).total_clients, 3);
    EXPECT_EQ(channels->at(1).channel_id, 2);
    EXPECT_EQ(channels->at(1).name, "AFK");
    EXPECT_EQ(channels->at(1).total_clients, 0);
    EXPECT_EQ(channels->at(1).order, 0);
}

TEST(Lines, TrimAndSplit)
{
    EXPECT_EQ(trim(" \r\n x y \n\r"), "x y");
    EXPECT_EQ(trim("\r\n"), "");

    std::vector<std::string> lines;
    for_each_line("a\n\r\n\rb\n", [&lines](std::string_view line) {
        lines.emplace_back(line);
        return true;
    });
    EXPECT_EQ(lines, (std::vector<std::string>{ "a", "b" }));
}
