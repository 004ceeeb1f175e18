#include "compressor.hpp"
#include "stats.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace imgmin;
using imgmin::test::FakeCodec;
using imgmin::test::TempDir;
using imgmin::test::read_file;
using imgmin::test::write_file;

namespace fs = std::filesystem;

namespace {

CompressOptions options_with(int quality, size_t jobs = 2) {
    CompressOptions options;
    options.quality = quality;
    options.concurrency = jobs;
    return options;
}

} // namespace

TEST(Quality, BoundsAreInclusive) {
    EXPECT_NO_THROW(validate_quality(1));
    EXPECT_NO_THROW(validate_quality(50));
    EXPECT_NO_THROW(validate_quality(100));
    EXPECT_THROW(validate_quality(0), Error);
    EXPECT_THROW(validate_quality(101), Error);
    EXPECT_THROW(validate_quality(-5), Error);
}

TEST(Concurrency, AutoIsAtLeastOne) {
    EXPECT_GE(resolve_concurrency(0), 1u);
    EXPECT_EQ(resolve_concurrency(3), 3u);
}

TEST(BatchCompressor, InvalidQualityFailsBeforeTouchingFiles) {
    TempDir dir;
    write_file(dir / "a.jpg", "image bytes");
    FakeCodec codec;

    for (int quality : {0, 101, -1, 1000}) {
        try {
            BatchCompressor compressor(codec, options_with(quality));
            compressor.run(dir.path());
            FAIL() << "quality " << quality << " accepted";
        } catch (const Error& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidQuality);
        }
    }
    EXPECT_EQ(codec.calls.load(), 0);
    EXPECT_FALSE(fs::exists(dir / "a_min.jpg"));
}

TEST(BatchCompressor, MissingDirectoryIsFatal) {
    TempDir dir;
    FakeCodec codec;
    BatchCompressor compressor(codec, options_with(50));
    try {
        compressor.run(dir / "missing");
        FAIL() << "expected DirectoryNotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DirectoryNotFound);
    }
}

TEST(BatchCompressor, NonImageDirectoryProducesNoResults) {
    TempDir dir;
    write_file(dir / "readme.txt", "hello");
    write_file(dir / "data.bin", "1234");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50)).run(dir.path());
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(codec.calls.load(), 0);
}

TEST(BatchCompressor, WritesSuffixedSiblingAndLeavesOriginal) {
    TempDir dir;
    write_file(dir / "photo.jpg", "0123456789");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(70)).run(dir.path());

    ASSERT_EQ(results.size(), 1u);
    const auto& r = results[0];
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.error, ErrorKind::None);
    EXPECT_EQ(r.output_path.filename().string(), "photo_min.jpg");
    EXPECT_EQ(r.original_size, 10u);
    EXPECT_EQ(r.compressed_size, 5u);
    EXPECT_DOUBLE_EQ(r.compression_ratio(), 0.5);
    EXPECT_EQ(codec.last_quality.load(), 70);

    EXPECT_EQ(read_file(dir / "photo.jpg"), "0123456789");
    EXPECT_EQ(read_file(dir / "photo_min.jpg"), "01234");
    EXPECT_FALSE(fs::exists(dir / "photo_min.jpg.tmp"));
}

TEST(BatchCompressor, ExistingCompressedSiblingIsOverwrittenNotProcessed) {
    TempDir dir;
    write_file(dir / "a.jpg", "AAAAAAAA");
    write_file(dir / "a_min.jpg", "stale");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50)).run(dir.path());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].input_path.filename().string(), "a.jpg");
    EXPECT_EQ(read_file(dir / "a_min.jpg"), "AAAA");
    EXPECT_FALSE(fs::exists(dir / "a_min_min.jpg"));
}

TEST(BatchCompressor, RunningTwiceKeepsOutputSetStable) {
    TempDir dir;
    write_file(dir / "a.jpg", "aaaa");
    write_file(dir / "b.png", "bbbb");
    write_file(dir / "sub" / "c.jpeg", "cccc");
    FakeCodec codec;
    BatchCompressor compressor(codec, options_with(50));

    auto first = compressor.run(dir.path());
    auto second = compressor.run(dir.path());

    EXPECT_EQ(first.size(), 3u);
    EXPECT_EQ(second.size(), first.size());

    size_t files = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir.path())) {
        if (entry.is_regular_file()) files++;
    }
    EXPECT_EQ(files, 6u);
}

TEST(BatchCompressor, PerFileFailuresDoNotAbortBatch) {
    TempDir dir;
    write_file(dir / "good.jpg", "good image");
    write_file(dir / "bad.jpg", "BAD image");
    write_file(dir / "empty.png", "");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50, 3)).run(dir.path());

    // sorted by input path
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].input_path.filename().string(), "bad.jpg");
    EXPECT_EQ(results[1].input_path.filename().string(), "empty.png");
    EXPECT_EQ(results[2].input_path.filename().string(), "good.jpg");

    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error, ErrorKind::CodecError);
    EXPECT_EQ(results[0].error_message, "not an image");
    EXPECT_FALSE(fs::exists(dir / "bad_min.jpg"));

    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error, ErrorKind::UnreadableFile);

    EXPECT_TRUE(results[2].success);
    EXPECT_TRUE(fs::exists(dir / "good_min.jpg"));

    auto stats = summarize(results);
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.succeeded, 1u);
}

TEST(BatchCompressor, LargerOutputIsReportedNotClamped) {
    TempDir dir;
    write_file(dir / "tiny.png", "BIG!");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50)).run(dir.path());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[0].discarded);
    EXPECT_EQ(results[0].original_size, 4u);
    EXPECT_EQ(results[0].compressed_size, 8u);
    EXPECT_LT(results[0].compression_ratio(), 0.0);
    EXPECT_TRUE(fs::exists(dir / "tiny_min.png"));
}

TEST(BatchCompressor, DropLargerRemovesOutputButKeepsSizes) {
    TempDir dir;
    write_file(dir / "tiny.png", "BIG!");
    write_file(dir / "fine.jpg", "halve me");
    FakeCodec codec;
    auto options = options_with(50);
    options.drop_larger = true;

    auto results = BatchCompressor(codec, options).run(dir.path());

    ASSERT_EQ(results.size(), 2u);
    const auto& fine = results[0];
    const auto& tiny = results[1];
    EXPECT_FALSE(fine.discarded);
    EXPECT_TRUE(fs::exists(dir / "fine_min.jpg"));

    EXPECT_TRUE(tiny.success);
    EXPECT_TRUE(tiny.discarded);
    EXPECT_EQ(tiny.compressed_size, 8u);
    EXPECT_FALSE(fs::exists(dir / "tiny_min.png"));

    auto stats = summarize(results);
    EXPECT_EQ(stats.discarded, 1u);
    EXPECT_EQ(stats.total_original, 8u);
}

TEST(BatchCompressor, CustomMarker) {
    TempDir dir;
    write_file(dir / "a.jpg", "abcd");
    write_file(dir / "b.small.jpg", "abcd");
    FakeCodec codec;
    auto options = options_with(50);
    options.marker = ".small";

    auto results = BatchCompressor(codec, options).run(dir.path());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(fs::exists(dir / "a.small.jpg"));
}

TEST(BatchCompressor, ManyFilesAcrossWorkers) {
    TempDir dir;
    for (int i = 0; i < 40; ++i) {
        write_file(dir / ("img" + std::to_string(100 + i) + ".jpg"), std::string(100 + i, 'x'));
    }
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50, 4)).run(dir.path());

    ASSERT_EQ(results.size(), 40u);
    EXPECT_EQ(codec.calls.load(), 40);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_TRUE(results[i].success);
        EXPECT_EQ(results[i].original_size, 100 + i);
        if (i > 0) {
            EXPECT_TRUE(results[i - 1].input_path < results[i].input_path);
        }
    }
}

TEST(BatchCompressor, FailedCompressRemovesStaleSibling) {
    TempDir dir;
    write_file(dir / "bad.jpg", "BAD new edited content");
    write_file(dir / "bad_min.jpg", "old compressed of previous version");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50, 1)).run(dir.path());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error, ErrorKind::CodecError);
    // replace darf danach nix altes mehr finden
    EXPECT_FALSE(fs::exists(dir / "bad_min.jpg"));
    EXPECT_EQ(read_file(dir / "bad.jpg"), "BAD new edited content");
}

TEST(BatchCompressor, UnwritableOutputIsWriteErrorAndBatchGoesOn) {
    TempDir dir;
    write_file(dir / "a.jpg", "aaaaaaaa");
    write_file(dir / "b.jpg", "bbbbbbbb");
    // verzeichnis mit inhalt an der output stelle, rename und remove schlagen fehl
    write_file(dir / "a_min.jpg" / "keep.txt", "blocker");
    FakeCodec codec;

    auto results = BatchCompressor(codec, options_with(50, 1)).run(dir.path());

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].input_path.filename().string(), "a.jpg");
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].error, ErrorKind::WriteError);
    EXPECT_FALSE(results[0].error_message.empty());
    EXPECT_FALSE(fs::exists(dir / "a_min.jpg.tmp"));
    EXPECT_TRUE(fs::is_directory(dir / "a_min.jpg"));

    EXPECT_TRUE(results[1].success);
    EXPECT_EQ(read_file(dir / "b_min.jpg"), "bbbb");
}
