#include <gtest/gtest.h>

#include <helpers.hpp>
#include <upload/exceptions.hpp>
#include <upload/pipeline.hpp>
#include <util/file_ops.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>

using namespace std::chrono_literals;

namespace {

using pipeline_t = UploadPipeline<reporting_t>;

struct UploadTest : public ::testing::Test {
    TempDir dir;
    QuietReporting reporting;
    UploadConfig config;

    void SetUp() override {
        config.upload_dir = dir / "uploads";
        config.backup_dir = dir / "backups";
    }

    pipeline_t make_pipeline() {
        return pipeline_t{ di::Deps<reporting_t>{ reporting.engine }, config };
    }

    std::filesystem::path source(std::string const &name, std::string const &content) {
        auto const path = dir / "incoming" / name;
        write_file(path, content);
        return path;
    }
};

} // namespace

TEST(FileOps, Sha256OfKnownContent) {
    TempDir dir;
    write_file(dir / "abc.txt", "abc");
    EXPECT_EQ(util::sha256_file(dir / "abc.txt"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    write_file(dir / "empty.txt", "");
    EXPECT_EQ(util::sha256_file(dir / "empty.txt"), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(FileOps, MimeTypes) {
    EXPECT_EQ(util::detect_mime_type("a.txt"), "text/plain");
    EXPECT_EQ(util::detect_mime_type("A.PDF"), "application/pdf");
    EXPECT_EQ(util::detect_mime_type("b.docx"), "application/msword");
    EXPECT_EQ(util::detect_mime_type("c.yml"), "application/x-yaml");
    EXPECT_EQ(util::detect_mime_type("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(util::detect_mime_type("noext"), "application/octet-stream");
    EXPECT_EQ(util::detect_mime_type("image.png"), "application/octet-stream");
}

TEST(FileOps, GzipWritesGzipStream) {
    TempDir dir;
    write_file(dir / "plain.txt", std::string(4096, 'a'));

    auto const size = util::gzip_file(dir / "plain.txt", dir / "plain.txt.gz");
    auto const data = read_file(dir / "plain.txt.gz");

    ASSERT_GE(data.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(data[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(data[1]), 0x8b);
    EXPECT_EQ(size, data.size());
    EXPECT_LT(size, 4096u);
}

TEST_F(UploadTest, FullProcedure) {
    auto const original = source("report.txt", std::string(8192, 'x'));
    auto pipeline       = make_pipeline();

    auto const info = pipeline.process_upload(original);

    EXPECT_EQ(info.filename, "report.txt");
    EXPECT_EQ(info.original_path.string(), original.string());
    EXPECT_EQ(info.file_size, 8192u);
    EXPECT_EQ(info.mime_type, "text/plain");
    EXPECT_EQ(info.processing_status, ProcessingStatus::Completed);
    EXPECT_EQ(info.metadata.checksum, util::sha256_file(original));

    EXPECT_EQ(info.processed_path.string(), (config.upload_dir / "report.txt.gz").string());
    EXPECT_TRUE(std::filesystem::exists(info.processed_path));
    EXPECT_FALSE(std::filesystem::exists(config.upload_dir / "report.txt"));
    ASSERT_TRUE(info.metadata.compression_ratio.has_value());
    EXPECT_GT(*info.metadata.compression_ratio, 1.0);

    ASSERT_TRUE(info.metadata.backup_path.has_value());
    EXPECT_EQ(info.metadata.backup_path->parent_path().string(), config.backup_dir.string());
    EXPECT_EQ(info.metadata.backup_path->extension().string(), ".bak");
    EXPECT_EQ(read_file(*info.metadata.backup_path), read_file(original));

    ASSERT_EQ(info.metadata.tags.size(), 2u);
    EXPECT_EQ(info.metadata.tags[0], "ext:gz");
    EXPECT_EQ(info.metadata.tags[1].rfind("uploaded:", 0), 0u);

    EXPECT_TRUE(std::filesystem::exists(config.upload_dir / "records" / (util::to_string(info.id) + ".json")));
    EXPECT_TRUE(std::filesystem::exists(original));
}

TEST_F(UploadTest, PlainCopyWithoutCompressionOrBackup) {
    config.compression_enabled = false;
    config.backup_enabled      = false;
    auto pipeline              = make_pipeline();

    auto const info = pipeline.process_upload(source("notes.txt", "hello"));

    EXPECT_EQ(info.processed_path.string(), (config.upload_dir / "notes.txt").string());
    EXPECT_EQ(read_file(info.processed_path), "hello");
    EXPECT_FALSE(info.metadata.compression_ratio.has_value());
    EXPECT_FALSE(info.metadata.backup_path.has_value());
    EXPECT_EQ(info.metadata.tags.front(), "ext:txt");
    EXPECT_FALSE(std::filesystem::exists(config.backup_dir));
}

TEST_F(UploadTest, LargeFileTag) {
    config.compression_enabled = false;
    config.backup_enabled      = false;
    auto pipeline              = make_pipeline();

    auto const info = pipeline.process_upload(source("big.txt", std::string(large_file_threshold + 1, 'z')));
    EXPECT_NE(std::find(std::begin(info.metadata.tags), std::end(info.metadata.tags), "large_file"), std::end(info.metadata.tags));
}

TEST_F(UploadTest, FileWithoutExtensionIsAllowed) {
    config.compression_enabled = false;
    auto pipeline              = make_pipeline();

    auto const info = pipeline.process_upload(source("README", "docs"));
    EXPECT_EQ(info.mime_type, "application/octet-stream");
    EXPECT_EQ(info.processing_status, ProcessingStatus::Completed);
}

TEST_F(UploadTest, RejectsMissingFile) {
    auto pipeline = make_pipeline();
    try {
        [[maybe_unused]] auto info = pipeline.process_upload(dir / "ghost.txt");
        FAIL() << "expected an upload error";
    } catch(UploadException const &e) {
        EXPECT_EQ(e.reason, "Upload path does not exist");
    }
}

TEST_F(UploadTest, RejectsDirectory) {
    std::filesystem::create_directories(dir / "folder.txt");
    auto pipeline = make_pipeline();
    EXPECT_THROW(static_cast<void>(pipeline.process_upload(dir / "folder.txt")), UploadException);
}

TEST_F(UploadTest, RejectsOversizedFile) {
    config.max_file_size = 10;
    auto pipeline        = make_pipeline();

    try {
        [[maybe_unused]] auto info = pipeline.process_upload(source("big.txt", std::string(11, 'a')));
        FAIL() << "expected an upload error";
    } catch(UploadException const &e) {
        EXPECT_EQ(e.reason, "File size 11 exceeds maximum allowed size 10");
    }
    EXPECT_FALSE(std::filesystem::exists(config.upload_dir));
}

TEST_F(UploadTest, RejectsExtension) {
    auto pipeline = make_pipeline();

    try {
        [[maybe_unused]] auto info = pipeline.process_upload(source("run.EXE", "MZ"));
        FAIL() << "expected an upload error";
    } catch(UploadException const &e) {
        EXPECT_EQ(e.reason, "File extension 'exe' is not allowed");
    }
}

TEST_F(UploadTest, ExtensionCheckIgnoresCase) {
    config.compression_enabled = false;
    auto pipeline              = make_pipeline();
    EXPECT_NO_THROW(static_cast<void>(pipeline.process_upload(source("LOUD.TXT", "HI"))));
}

TEST_F(UploadTest, ListGetDelete) {
    auto pipeline = make_pipeline();

    auto const first  = pipeline.process_upload(source("one.txt", "1"));
    auto const second = pipeline.process_upload(source("two.txt", "22"));

    auto const uploads = pipeline.list_uploads();
    ASSERT_EQ(uploads.size(), 2u);
    EXPECT_EQ(uploads[0].id, first.id);
    EXPECT_EQ(uploads[1].id, second.id);

    auto const loaded = pipeline.get_upload(second.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->filename, "two.txt");
    EXPECT_EQ(loaded->processed_path.string(), second.processed_path.string());
    EXPECT_EQ(loaded->metadata.checksum, second.metadata.checksum);
    EXPECT_EQ(loaded->metadata.tags, second.metadata.tags);
    EXPECT_EQ(loaded->processing_status, ProcessingStatus::Completed);

    EXPECT_TRUE(pipeline.delete_upload(first.id));
    EXPECT_FALSE(std::filesystem::exists(first.processed_path));
    EXPECT_FALSE(std::filesystem::exists(*first.metadata.backup_path));
    EXPECT_FALSE(pipeline.get_upload(first.id).has_value());
    EXPECT_FALSE(pipeline.delete_upload(first.id));

    EXPECT_EQ(pipeline.list_uploads().size(), 1u);
}

TEST_F(UploadTest, ListSkipsDamagedRecords) {
    auto pipeline = make_pipeline();
    static_cast<void>(pipeline.process_upload(source("one.txt", "1")));
    write_file(config.upload_dir / "records" / "garbage.json", "{ not json");

    EXPECT_EQ(pipeline.list_uploads().size(), 1u);
}

TEST(Archive, OnlyOldUploads) {
    auto const now = std::chrono::system_clock::now();
    EXPECT_FALSE(is_archivable(now, now));
    EXPECT_FALSE(is_archivable(now - 29 * 24h, now));
    EXPECT_TRUE(is_archivable(now - 31 * 24h, now));
}
