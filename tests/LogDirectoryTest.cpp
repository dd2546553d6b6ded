#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include "TestHelpers.hpp"
#include "core/ParseError.hpp"
#include "input/FileParser.hpp"
#include "input/LogDirectory.hpp"
#include "utils/Logger.hpp"

namespace fs = std::filesystem;

using AgentLog::Core::ParseError;
using AgentLog::Input::FileParser;
using AgentLog::Input::findLogFiles;
using AgentLog::Input::parseLogFiles;
using AgentLog::Testing::TempDir;
using AgentLog::Utils::Logger;

TEST(LogDirectoryTest, FindsOnlyLogFilesSortedByPath)
{
    TempDir dir;
    dir.writeFile("b_session.log", "");
    dir.writeFile("a_session.log", "");
    dir.writeFile("notes.txt", "");
    dir.writeFile("session.log.bak", "");
    fs::create_directories(dir.path() / "nested.log");

    const auto files = findLogFiles(dir.path());

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "a_session.log");
    EXPECT_EQ(files[1].filename().string(), "b_session.log");
}

TEST(LogDirectoryTest, EmptyDirectoryHasNoFiles)
{
    TempDir dir;
    EXPECT_TRUE(findLogFiles(dir.path()).empty());
}

TEST(LogDirectoryTest, MissingDirectoryThrowsFileNotFound)
{
    TempDir dir;

    try
    {
        findLogFiles(dir.path() / "missing");
        FAIL() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.kind(), ParseError::Kind::FileNotFound);
    }
}

TEST(LogDirectoryTest, RegularFileThrowsIo)
{
    TempDir dir;
    const auto file = dir.writeFile("session.log", "");

    try
    {
        findLogFiles(file);
        FAIL() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.kind(), ParseError::Kind::Io);
    }
}

TEST(LogDirectoryTest, UnreadableDirectoryThrowsIoInsteadOfFilesystemError)
{
    TempDir dir;
    const auto locked = dir.path() / "locked";
    fs::create_directories(locked);
    fs::permissions(locked, fs::perms::none);

    std::error_code listEc;
    fs::directory_iterator check(locked, listEc);
    if (!listEc)
    {
        fs::permissions(locked, fs::perms::owner_all);
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    try
    {
        findLogFiles(locked);
        ADD_FAILURE() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.kind(), ParseError::Kind::Io);
    }
    fs::permissions(locked, fs::perms::owner_all);
}

TEST(LogDirectoryTest, ConcatenatesEntriesInFileOrder)
{
    TempDir dir;
    dir.writeFile("1.log", "[2024-01-15T10:00:00Z] INFO: first\n"
                           "[2024-01-15T10:00:01Z] INFO: second\n");
    dir.writeFile("2.log", "[2024-01-15T09:00:00Z] ERROR: third\n");

    std::ostringstream out;
    Logger logger(out);
    FileParser parser(logger);

    const auto entries = parseLogFiles(findLogFiles(dir.path()), parser, logger);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message(), "first");
    EXPECT_EQ(entries[1].message(), "second");
    EXPECT_EQ(entries[2].message(), "third");
    EXPECT_NE(out.str().find("1.log: 2 entries"), std::string::npos);
}

TEST(LogDirectoryTest, SkipsFilesThatFailToOpen)
{
    TempDir dir;
    const auto good = dir.writeFile("good.log", "[2024-01-15T10:00:00Z] INFO: kept\n");
    const auto gone = dir.path() / "gone.log";

    std::ostringstream out;
    Logger logger(out);
    FileParser parser(logger);

    const auto entries = parseLogFiles({gone, good}, parser, logger);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message(), "kept");
    EXPECT_NE(out.str().find("[WARN] Failed to parse"), std::string::npos);
    EXPECT_NE(out.str().find("File not found"), std::string::npos);
}
