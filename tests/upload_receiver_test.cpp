#include <gtest/gtest.h>

#include "upload_receiver.hpp"
#include "pcdrop/errors.hpp"
#include "test_support.hpp"

#include <filesystem>

using namespace pcdrop;
using pcdrop::test::StringSource;
using pcdrop::test::TempDir;

namespace {

// fails every write whose target name contains the marker
class FaultyView : public FilesystemView {
public:
    FaultyView(const std::filesystem::path &up, const std::filesystem::path &down, std::string marker)
        : FilesystemView(up, down), marker(std::move(marker)) {}

protected:
    void writeChunk(std::ostream &out, const char *data, const size_t &len, const std::filesystem::path &target) override {
        if (target.filename().string().find(this->marker) != std::string::npos) {
            throw TransferError(ErrorKind::DiskFull, "injected disk error");
        }
        FilesystemView::writeChunk(out, data, len, target);
    }

private:
    std::string marker;
};

class UploadReceiverTest : public ::testing::Test {
protected:
    TempDir dir{"upload"};
    EventChannel events{64, false};

    std::filesystem::path uploads() const { return dir / "uploads"; }
};

}

TEST_F(UploadReceiverTest, StoresEveryFilePart) {
    FilesystemView view(uploads(), dir / "downloads");
    view.ensureRoots();
    std::string body = test::multipart_body("bnd", {{"one.txt", "1"}, {"two.txt", std::string(100000, '2')}});
    StringSource source(body, 777);
    MultipartReader reader(source, "bnd");

    UploadResult result = receive_uploads(reader, view, UploadOptions{1000000, false}, &this->events);
    EXPECT_EQ(result.succeeded, 2);
    EXPECT_EQ(result.failed, 0);
    EXPECT_EQ(result.bytes, 100001u);
    std::vector<std::string> stored{"uploads/one.txt", "uploads/two.txt"};
    EXPECT_EQ(result.stored, stored);
    EXPECT_EQ(test::read_file(uploads() / "two.txt"), std::string(100000, '2'));

    size_t logged = 0;
    for (const auto &event : this->events.drain()) {
        if (event.message.rfind("Uploaded: ", 0) == 0) logged++;
    }
    EXPECT_EQ(logged, 2u);
}

TEST_F(UploadReceiverTest, FailedPartDoesNotAbortTheOthers) {
    FaultyView view(uploads(), dir / "downloads", "second");
    view.ensureRoots();
    std::string body = test::multipart_body("bnd", {{"first.bin", "aaaa"}, {"second.bin", std::string(5000, 'b')}, {"third.bin", "cccc"}});
    StringSource source(body, 64);
    MultipartReader reader(source, "bnd");

    UploadResult result = receive_uploads(reader, view, UploadOptions{1000000, false}, &this->events);
    EXPECT_EQ(result.succeeded, 2);
    EXPECT_EQ(result.failed, 1);
    EXPECT_TRUE(std::filesystem::exists(uploads() / "first.bin"));
    EXPECT_TRUE(std::filesystem::exists(uploads() / "third.bin"));
    EXPECT_FALSE(std::filesystem::exists(uploads() / "second.bin"));
    EXPECT_FALSE(std::filesystem::exists(uploads() / "second.bin.part"));
}

TEST_F(UploadReceiverTest, EscapingNameFailsOnlyThatPart) {
    FilesystemView view(uploads(), dir / "downloads");
    view.ensureRoots();
    std::string body = test::multipart_body("bnd", {{"../evil.txt", "x"}, {"ok.txt", "y"}});
    StringSource source(body);
    MultipartReader reader(source, "bnd");

    UploadResult result = receive_uploads(reader, view, UploadOptions{1000, false}, nullptr);
    EXPECT_EQ(result.succeeded, 1);
    EXPECT_EQ(result.failed, 1);
    EXPECT_FALSE(std::filesystem::exists(dir / "evil.txt"));
}

TEST_F(UploadReceiverTest, OversizeAbortsAndLeavesNoFragment) {
    FilesystemView view(uploads(), dir / "downloads");
    view.ensureRoots();
    // the limit covers the whole request, not each part
    std::string body = test::multipart_body("bnd", {{"a.bin", std::string(600, 'a')}, {"b.bin", std::string(600, 'b')}});
    StringSource source(body, 100);
    MultipartReader reader(source, "bnd");

    try {
        receive_uploads(reader, view, UploadOptions{1000, false}, nullptr);
        FAIL() << "expected OversizeUpload";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::OversizeUpload);
    }
    EXPECT_FALSE(std::filesystem::exists(uploads() / "b.bin"));
    EXPECT_FALSE(std::filesystem::exists(uploads() / "b.bin.part"));
}

TEST_F(UploadReceiverTest, FolderUploadKeepsSubdirectories) {
    FilesystemView view(uploads(), dir / "downloads");
    view.ensureRoots();
    std::string body = test::multipart_body("bnd", {{"album/pic.jpg", "jpeg"}});
    StringSource source(body);
    MultipartReader reader(source, "bnd");

    UploadResult result = receive_uploads(reader, view, UploadOptions{1000, false}, nullptr);
    EXPECT_EQ(result.succeeded, 1);
    EXPECT_EQ(test::read_file(uploads() / "album" / "pic.jpg"), "jpeg");
}

TEST(UploadRelativePathTest, NormalizesClientNames) {
    std::time_t when = 0;
    EXPECT_EQ(upload_relative_path("photo.jpg", false, when), "photo.jpg");
    EXPECT_EQ(upload_relative_path("dir\\photo.jpg", false, when), "dir/photo.jpg");
    EXPECT_EQ(upload_relative_path("C:\\Users\\me\\photo.jpg", false, when), "photo.jpg");
    EXPECT_EQ(upload_relative_path("/storage/emulated/0/DCIM/photo.jpg", false, when), "photo.jpg");

    std::string stamped = upload_relative_path("dir/photo.jpg", true, std::time(nullptr));
    ASSERT_EQ(stamped.size(), std::string("dir/YYYYmmdd_HHMMSS_photo.jpg").size());
    EXPECT_EQ(stamped.substr(0, 4), "dir/");
    EXPECT_EQ(stamped.substr(stamped.size() - 10), "_photo.jpg");
}
