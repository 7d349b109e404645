#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "format/hufz_format.hpp"
#include "io/errors.hpp"
#include "io/file_io.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class FileCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("hufz_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    fs::path dir_;
};

} // namespace

TEST_F(FileCodecTest, RoundTripThroughFiles) {
    std::vector<uint8_t> src;
    for (int i = 0; i < 20000; ++i) src.push_back(static_cast<uint8_t>((i * i) % 251));
    hufz::write_all(path("in.bin"), src);

    hufz::CodecStats enc = hufz::encode_file(path("in.bin"), path("in.hufz"));
    EXPECT_EQ(enc.input_bytes, src.size());
    EXPECT_EQ(hufz::count_bytes_in_file(path("in.hufz")), enc.output_bytes);

    hufz::CodecStats dec = hufz::decode_file(path("in.hufz"), path("out.bin"));
    EXPECT_EQ(dec.output_bytes, src.size());
    EXPECT_EQ(hufz::read_all(path("out.bin")), src);
}

TEST_F(FileCodecTest, EmptyFileRoundTrip) {
    hufz::write_all(path("empty"), {});
    hufz::encode_file(path("empty"), path("empty.hufz"));
    EXPECT_EQ(hufz::count_bytes_in_file(path("empty.hufz")), hufz::kHufzHeaderBytes);
    hufz::decode_file(path("empty.hufz"), path("empty.out"));
    EXPECT_EQ(hufz::count_bytes_in_file(path("empty.out")), 0u);
}

TEST_F(FileCodecTest, MissingInputIsIoError) {
    EXPECT_THROW(hufz::encode_file(path("nope"), path("x.hufz")), hufz::IoError);
    EXPECT_THROW(hufz::decode_file(path("nope.hufz"), path("x")), hufz::IoError);
    EXPECT_THROW(hufz::read_all(path("nope")), hufz::IoError);
    EXPECT_THROW(hufz::count_bytes_in_file(path("nope")), hufz::IoError);
}

TEST_F(FileCodecTest, UnwritableOutputIsIoError) {
    hufz::write_all(path("in.bin"), {1, 2, 3});
    const std::string bad_out = path("missing_dir/out.hufz");
    EXPECT_THROW(hufz::encode_file(path("in.bin"), bad_out), hufz::IoError);
    EXPECT_THROW(hufz::write_all(bad_out, {1}), hufz::IoError);
}

TEST_F(FileCodecTest, PlainFileIsFormatErrorNotIoError) {
    const std::string text = "definitely not a compressed file";
    hufz::write_all(path("plain.txt"), std::vector<uint8_t>(text.begin(), text.end()));
    EXPECT_THROW(hufz::decode_file(path("plain.txt"), path("plain.out")), hufz::FormatError);
}
