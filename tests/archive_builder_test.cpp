#include <gtest/gtest.h>

#include "archive_builder.hpp"
#include "zip_writer.hpp"
#include "pcdrop/errors.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <sstream>

using namespace pcdrop;
using pcdrop::test::StringSink;
using pcdrop::test::TempDir;

namespace {

class ArchiveBuilderTest : public ::testing::Test {
protected:
    TempDir dir{"archive"};
    FilesystemView view{dir / "uploads", dir / "downloads"};

    void SetUp() override {
        this->view.ensureRoots();
        test::write_file(dir / "downloads" / "a.txt", "contents of a");
        test::write_file(dir / "downloads" / "b" / "c.txt", std::string(50000, 'c'));
        test::write_file(dir / "downloads" / "b" / "d" / "e.bin", "eee");
        std::filesystem::create_directories(dir / "downloads" / "b" / "empty");
    }

    std::string build(const std::vector<std::string> &paths, const int &level = 6) {
        ArchiveBuilder builder(this->view, level);
        StringSink sink;
        builder.build(paths, sink);
        return sink.data;
    }
};

// removes a planned member as soon as the first archive bytes arrive
class DeletingSink : public ByteSink {
public:
    explicit DeletingSink(std::filesystem::path victim) : victim(std::move(victim)) {}
    void write(const char *, const size_t &) override {
        std::error_code ec;
        std::filesystem::remove(this->victim, ec);
    }

private:
    std::filesystem::path victim;
};

}

TEST(ZipWriterTest, EmptyArchiveIsJustTheEndRecord) {
    StringSink sink;
    ZipWriter writer(sink, 6);
    writer.finish();
    ASSERT_EQ(sink.data.size(), 22u);
    EXPECT_EQ(sink.data.substr(0, 4), std::string("PK\x05\x06", 4));
    EXPECT_TRUE(test::read_zip(sink.data).empty());
}

TEST(ZipWriterTest, StoredAndDeflatedMembersRoundTrip) {
    for (int level : {0, 1, 9}) {
        StringSink sink;
        ZipWriter writer(sink, level);
        std::istringstream small("hello zip");
        std::istringstream big(std::string(300000, 'z'));
        writer.addFile("small.txt", small, 9);
        writer.addDirectory("folder");
        writer.addFile("folder/big.txt", big, 300000);
        writer.finish();
        EXPECT_EQ(writer.entryCount(), 3u);
        EXPECT_EQ(writer.bytesWritten(), sink.data.size());

        auto members = test::read_zip(sink.data);
        ASSERT_EQ(members.size(), 3u);
        EXPECT_EQ(members["small.txt"].content, "hello zip");
        EXPECT_EQ(members["small.txt"].method, level == 0 ? 0 : 8);
        EXPECT_EQ(members["folder/"].content, "");
        EXPECT_EQ(members["folder/big.txt"].content, std::string(300000, 'z'));
    }
}

TEST(ZipWriterTest, RefusesEntriesAfterFinish) {
    StringSink sink;
    ZipWriter writer(sink, 6);
    writer.finish();
    std::istringstream in("x");
    EXPECT_THROW(writer.addFile("late", in, 1), std::logic_error);
}

TEST_F(ArchiveBuilderTest, SelectionRoundTripKeepsRelativePaths) {
    std::string zip = this->build({"a.txt", "b/c.txt"});
    auto members = test::read_zip(zip);
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members["a.txt"].content, "contents of a");
    EXPECT_EQ(members["b/c.txt"].content, std::string(50000, 'c'));
}

TEST_F(ArchiveBuilderTest, FolderIsWalkedInListingOrder) {
    std::string zip = this->build({"downloads/b"});
    std::vector<std::string> names = test::zip_names(zip);
    std::vector<std::string> expected{"b/d/e.bin", "b/empty/", "b/c.txt"};
    EXPECT_EQ(names, expected);

    auto members = test::read_zip(zip);
    EXPECT_EQ(members["b/d/e.bin"].content, "eee");
}

TEST_F(ArchiveBuilderTest, NamesAreRelativeToCommonAncestor) {
    std::string zip = this->build({"b/d/e.bin", "b/c.txt"});
    std::vector<std::string> names = test::zip_names(zip);
    std::vector<std::string> expected{"d/e.bin", "c.txt"};
    EXPECT_EQ(names, expected);
}

TEST_F(ArchiveBuilderTest, SameSelectionGivesIdenticalBytes) {
    std::string first = this->build({"b", "a.txt"});
    std::filesystem::last_write_time(dir / "downloads" / "a.txt", std::filesystem::file_time_type::clock::now());
    std::string second = this->build({"b", "a.txt"});
    EXPECT_EQ(first, second);
}

TEST_F(ArchiveBuilderTest, DuplicateSelectionIsWrittenOnce) {
    std::string zip = this->build({"a.txt", "downloads/a.txt"});
    EXPECT_EQ(test::zip_names(zip).size(), 1u);
}

TEST_F(ArchiveBuilderTest, PlanSuggestsArchiveName) {
    ArchiveBuilder builder(this->view, 6);
    EXPECT_EQ(builder.plan({"b"}).suggested_name, "b.zip");
    EXPECT_EQ(builder.plan({"a.txt", "b"}).suggested_name, "selected_files.zip");
}

TEST_F(ArchiveBuilderTest, PlanFailsUpFront) {
    ArchiveBuilder builder(this->view, 6);
    try {
        builder.plan({});
        FAIL() << "expected BadRequest";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::BadRequest);
    }
    try {
        builder.plan({"a.txt", "missing.txt"});
        FAIL() << "expected NotFound";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    try {
        builder.plan({"../outside"});
        FAIL() << "expected PathEscape";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::PathEscape);
    }
}

TEST_F(ArchiveBuilderTest, MemberVanishingMidStreamIsIOError) {
    ArchiveBuilder builder(this->view, 6);
    ArchivePlan plan = builder.plan({"a.txt", "b/c.txt"});
    DeletingSink sink(dir / "downloads" / "b" / "c.txt");
    try {
        builder.stream(plan, sink);
        FAIL() << "expected IOError";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::IOError);
    }
}

TEST_F(ArchiveBuilderTest, SymlinkLoopIsVisitedOnce) {
    std::filesystem::create_directory_symlink(dir / "downloads" / "b", dir / "downloads" / "b" / "d" / "loop");
    ArchiveBuilder builder(this->view, 6);
    ArchivePlan plan = builder.plan({"b"});
    EXPECT_LT(plan.items.size(), 10u);
}

TEST_F(ArchiveBuilderTest, LinkOutOfRootIsSkippedAtPlanTime) {
    test::write_file(dir / "outside" / "secret.txt", "secret");
    std::filesystem::create_symlink(dir / "outside" / "secret.txt", dir / "downloads" / "b" / "zlink.txt");
    std::filesystem::create_directory_symlink(dir / "outside", dir / "downloads" / "b" / "zdir");

    ArchiveBuilder builder(this->view, 6);
    ArchivePlan plan = builder.plan({"downloads/b"});
    ASSERT_EQ(plan.skipped.size(), 2u);
    for (const auto &item : plan.items) {
        EXPECT_EQ(item.entry_name.find("zlink"), std::string::npos);
        EXPECT_EQ(item.entry_name.find("zdir"), std::string::npos);
    }

    // the whole archive streams, nothing escapes mid-way
    StringSink sink;
    EXPECT_NO_THROW(builder.stream(plan, sink));
    auto members = test::read_zip(sink.data);
    EXPECT_EQ(members.size(), plan.items.size());
    for (const auto &[name, member] : members) {
        EXPECT_NE(member.content, "secret") << name;
    }
}

TEST_F(ArchiveBuilderTest, AliasedDirectoriesAreBothArchived) {
    test::write_file(dir / "downloads" / "real" / "x.txt", "x");
    std::filesystem::create_directory_symlink(dir / "downloads" / "real", dir / "downloads" / "alias");

    std::string zip = this->build({"downloads/alias", "downloads/real"});
    std::vector<std::string> names = test::zip_names(zip);
    std::vector<std::string> expected{"alias/x.txt", "real/x.txt"};
    EXPECT_EQ(names, expected);
}
