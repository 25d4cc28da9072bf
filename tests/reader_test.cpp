#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include <zstd.h>

#include <mnist/reader.hpp>

#include "idx_fixtures.hpp"
#include "loopback_server.hpp"

namespace {

std::string offline_url() { return "http://127.0.0.1:" + std::to_string(unused_port()); }

} // namespace

TEST(MnistReaderTest, DefaultsToPublicMirror) {
    mnist::MnistReader reader("some-dir", nullptr);
    EXPECT_EQ(reader.mnist_url, "https://raw.githubusercontent.com/fgnt/mnist/master");
    EXPECT_EQ(reader.save_dir, "some-dir");
    EXPECT_EQ(reader.state(), mnist::LoadState::Unloaded);
    EXPECT_TRUE(reader.train_images.empty());
    EXPECT_TRUE(reader.test_labels.empty());
}

TEST(MnistReaderTest, LoadsBothSplitsFromCache) {
    auto dir = fresh_dir("reader_cache");
    write_synthetic_cache(dir, 12, 5);

    mnist::MnistReader reader(dir, nullptr);
    reader.mnist_url = offline_url();
    reader.load();

    EXPECT_EQ(reader.state(), mnist::LoadState::FullyLoaded);
    ASSERT_EQ(reader.train_labels.size(), 12u);
    ASSERT_EQ(reader.train_images.size(), 12u);
    ASSERT_EQ(reader.test_labels.size(), 5u);
    ASSERT_EQ(reader.test_images.size(), 5u);
    for (const auto& img : reader.train_images)
        EXPECT_EQ(img.size(), 12u);
    EXPECT_EQ(reader.train_labels[11], 1u);
    EXPECT_EQ(reader.test_labels[0], 3u);
    EXPECT_FLOAT_EQ(reader.train_images[0][0], 1.0f / 255.0f);
    EXPECT_FLOAT_EQ(reader.test_images[0][1], 9.0f / 255.0f);
}

TEST(MnistReaderTest, DownloadsThenLoads) {
    std::vector<std::uint8_t> labels{3, 1, 4};
    auto train_labels = as_string(gzip_bytes(make_label_bytes(labels)));
    auto train_images = as_string(gzip_bytes(make_image_bytes(3, 2, 2)));
    auto test_labels = as_string(gzip_bytes(make_label_bytes({9})));
    auto test_images = as_string(gzip_bytes(make_image_bytes(1, 2, 2)));
    LoopbackServer server([&](const std::string& target) {
        if (target == "/train-labels-idx1-ubyte.gz")
            return LoopbackServer::ok(train_labels);
        if (target == "/train-images-idx3-ubyte.gz")
            return LoopbackServer::ok(train_images);
        if (target == "/t10k-labels-idx1-ubyte.gz")
            return LoopbackServer::ok(test_labels);
        if (target == "/t10k-images-idx3-ubyte.gz")
            return LoopbackServer::ok(test_images);
        return LoopbackServer::status(404, "Not Found");
    });

    auto dir = fresh_dir("reader_download") + "/data";
    std::ostringstream log;
    mnist::MnistReader reader(dir, &log);
    reader.mnist_url = server.url();
    reader.load();

    EXPECT_EQ(server.request_count(), 4u);
    EXPECT_EQ(reader.train_labels, labels);
    EXPECT_EQ(reader.train_images.size(), 3u);
    EXPECT_EQ(reader.test_labels, std::vector<std::uint8_t>{9});
    EXPECT_NE(log.str().find("Downloading: t10k-images-idx3-ubyte.gz..."), std::string::npos);

    // Second load hits the cache only and decodes the same data.
    auto first_train = reader.train_images;
    auto first_test = reader.test_images;
    reader.load();
    EXPECT_EQ(server.request_count(), 4u);
    EXPECT_EQ(reader.train_images, first_train);
    EXPECT_EQ(reader.test_images, first_test);
    EXPECT_EQ(reader.state(), mnist::LoadState::FullyLoaded);
}

TEST(MnistReaderTest, StaticDownloadFilesUsesGivenDirectory) {
    auto dir = fresh_dir("reader_static");
    write_synthetic_cache(dir, 1, 1);
    std::ostringstream log;
    EXPECT_EQ(mnist::MnistReader::download_files(dir, offline_url(), &log), 0u);
    EXPECT_NE(log.str().find("File: t10k-labels-idx1-ubyte.gz"), std::string::npos);
}

TEST(MnistReaderTest, TransportFailurePropagates) {
    auto dir = fresh_dir("reader_offline");
    write_bytes(dir + "/train-images-idx3-ubyte.gz", gzip_bytes(make_image_bytes(1, 2, 2)));

    mnist::MnistReader reader(dir, nullptr);
    reader.mnist_url = offline_url();
    try {
        reader.load();
        FAIL() << "expected LoadError";
    } catch (const mnist::LoadError& e) {
        EXPECT_EQ(e.kind(), mnist::ErrorKind::Transport);
        EXPECT_TRUE(e.is_retryable());
    }
    EXPECT_EQ(reader.state(), mnist::LoadState::Unloaded);
    EXPECT_TRUE(reader.train_images.empty());
}

TEST(MnistReaderTest, CorruptTestSplitKeepsTrainData) {
    auto dir = fresh_dir("reader_corrupt");
    write_synthetic_cache(dir, 4, 2);
    auto truncated = make_image_bytes(2, 4, 3);
    truncated.pop_back();
    write_bytes(dir + "/t10k-images-idx3-ubyte.gz", gzip_bytes(truncated));

    mnist::MnistReader reader(dir, nullptr);
    reader.mnist_url = offline_url();
    try {
        reader.load();
        FAIL() << "expected LoadError";
    } catch (const mnist::LoadError& e) {
        EXPECT_EQ(e.kind(), mnist::ErrorKind::Corrupt);
    }
    EXPECT_EQ(reader.state(), mnist::LoadState::TrainLoaded);
    EXPECT_EQ(reader.train_images.size(), 4u);
    EXPECT_TRUE(reader.test_images.empty());
}

TEST(MnistReaderTest, CorruptArchiveIsDecompressError) {
    auto dir = fresh_dir("reader_bad_gzip");
    write_synthetic_cache(dir, 2, 2);
    write_bytes(dir + "/train-labels-idx1-ubyte.gz", {0x1f, 0x8b, 0x08, 0x00, 0x00});

    mnist::MnistReader reader(dir, nullptr);
    reader.mnist_url = offline_url();
    try {
        reader.load();
        FAIL() << "expected LoadError";
    } catch (const mnist::LoadError& e) {
        EXPECT_EQ(e.kind(), mnist::ErrorKind::Decompress);
    }
    EXPECT_EQ(reader.state(), mnist::LoadState::FilesEnsured);
}

TEST(MnistReaderTest, CachedHtmlPageIsNotLoaded) {
    auto dir = fresh_dir("reader_html");
    write_synthetic_cache(dir, 3, 2);
    std::string html = "<!DOCTYPE html>\n<html><head><title>Moved</title></head>"
                       "<body>Try again later</body></html>\n";
    write_bytes(dir + "/train-labels-idx1-ubyte.gz",
                std::vector<std::uint8_t>(html.begin(), html.end()));

    mnist::MnistReader reader(dir, nullptr);
    reader.mnist_url = offline_url();
    try {
        reader.load();
        FAIL() << "expected LoadError";
    } catch (const mnist::LoadError& e) {
        EXPECT_EQ(e.kind(), mnist::ErrorKind::Decompress);
        EXPECT_FALSE(e.is_retryable());
    }
    EXPECT_EQ(reader.state(), mnist::LoadState::FilesEnsured);
    EXPECT_TRUE(reader.train_labels.empty());
    EXPECT_TRUE(reader.train_images.empty());
}

TEST(MnistReaderTest, LabelImageCountMismatchIsCorrupt) {
    auto dir = fresh_dir("reader_mismatch");
    write_synthetic_cache(dir, 2, 2);
    write_bytes(dir + "/train-labels-idx1-ubyte.gz", gzip_bytes(make_label_bytes({1, 2, 3})));

    mnist::MnistReader reader(dir, nullptr);
    try {
        reader.load_split(mnist::Split::Train);
        FAIL() << "expected LoadError";
    } catch (const mnist::LoadError& e) {
        EXPECT_EQ(e.kind(), mnist::ErrorKind::Corrupt);
    }
    EXPECT_TRUE(reader.train_labels.empty());
    EXPECT_TRUE(reader.train_images.empty());
}

TEST(MnistReaderTest, LoadSplitAcceptsZstdArchives) {
    auto dir = fresh_dir("reader_zstd");
    auto raw = make_image_bytes(2, 3, 3);
    std::vector<std::uint8_t> zst(ZSTD_compressBound(raw.size()));
    zst.resize(ZSTD_compress(zst.data(), zst.size(), raw.data(), raw.size(), 3));
    write_bytes(dir + "/t10k-images-idx3-ubyte.gz", zst);
    auto labels = make_label_bytes({2, 7});
    std::vector<std::uint8_t> labels_zst(ZSTD_compressBound(labels.size()));
    labels_zst.resize(
        ZSTD_compress(labels_zst.data(), labels_zst.size(), labels.data(), labels.size(), 3));
    write_bytes(dir + "/t10k-labels-idx1-ubyte.gz", labels_zst);

    mnist::MnistReader reader(dir, nullptr);
    reader.load_split(mnist::Split::Test);
    EXPECT_EQ(reader.test_labels, (std::vector<std::uint8_t>{2, 7}));
    ASSERT_EQ(reader.test_images.size(), 2u);
    EXPECT_EQ(reader.test_images[1].size(), 9u);
    EXPECT_TRUE(reader.train_images.empty());
    EXPECT_EQ(reader.state(), mnist::LoadState::Unloaded);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
