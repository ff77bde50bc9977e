#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <png.h>
#include <string>
#include <unistd.h>
#include <vector>

#include "gfx/surface.hpp"
#include "media/animation_params.hpp"
#include "media/encode_error.hpp"
#include "media/gif_writer.hpp"
#include "media/png_writer.hpp"

namespace evalbox::media {
namespace {

constexpr std::size_t kScreenEnd = 13 + 256 * 3;
constexpr std::size_t kNetscapeLength = 19;

std::uint16_t WordAt(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

// Delay word of every graphic control extension, in stream order.
std::vector<std::uint16_t> FrameDelays(const std::vector<std::uint8_t>& bytes) {
    std::vector<std::uint16_t> delays;
    std::size_t offset = kScreenEnd;
    auto skip_sub_blocks = [&bytes, &offset] {
        while (bytes[offset] != 0) {
            offset += bytes[offset] + 1;
        }
        ++offset;
    };
    while (offset < bytes.size() && bytes[offset] != 0x3B) {
        if (bytes[offset] == 0x21) {
            if (bytes[offset + 1] == 0xF9) {
                delays.push_back(WordAt(bytes, offset + 4));
            }
            offset += 2;
            skip_sub_blocks();
        } else {
            offset += 10 + 1;
            skip_sub_blocks();
        }
    }
    return delays;
}

// Reference GIF LZW decoder for the single-frame image data that follows the
// image descriptor starting at `offset`.
std::vector<std::uint8_t> DecodeFrameIndices(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    const int min_code_size = bytes[offset++];
    std::vector<std::uint8_t> data;
    while (bytes[offset] != 0) {
        const std::size_t count = bytes[offset++];
        data.insert(data.end(), bytes.begin() + offset, bytes.begin() + offset + count);
        offset += count;
    }

    const int clear = 1 << min_code_size;
    const int end = clear + 1;
    std::vector<std::vector<std::uint8_t>> dict;
    int code_size = min_code_size + 1;
    auto reset = [&] {
        dict.clear();
        for (int i = 0; i < clear; ++i) {
            dict.push_back({static_cast<std::uint8_t>(i)});
        }
        dict.emplace_back();
        dict.emplace_back();
        code_size = min_code_size + 1;
    };
    reset();

    std::size_t bit = 0;
    auto read = [&](int width) {
        int code = 0;
        for (int i = 0; i < width; ++i, ++bit) {
            if (bit / 8 >= data.size()) {
                return -1;
            }
            code |= ((data[bit / 8] >> (bit % 8)) & 1) << i;
        }
        return code;
    };

    std::vector<std::uint8_t> out;
    int prev = -1;
    while (true) {
        const int code = read(code_size);
        if (code < 0 || code == end) {
            break;
        }
        if (code == clear) {
            reset();
            prev = -1;
            continue;
        }
        std::vector<std::uint8_t> entry;
        if (code < static_cast<int>(dict.size())) {
            entry = dict[code];
        } else if (prev >= 0 && code == static_cast<int>(dict.size())) {
            entry = dict[prev];
            entry.push_back(dict[prev][0]);
        } else {
            ADD_FAILURE() << "invalid LZW code " << code;
            break;
        }
        out.insert(out.end(), entry.begin(), entry.end());
        if (prev >= 0 && dict.size() < 4096) {
            auto added = dict[prev];
            added.push_back(entry[0]);
            dict.push_back(std::move(added));
        }
        prev = code;
        if (static_cast<int>(dict.size()) == (1 << code_size) && code_size < 12) {
            ++code_size;
        }
    }
    return out;
}

class MediaFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("evalbox_media_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST(AnimationParamsTest, DelayIsClampedThenConvertedToCentiseconds) {
    EXPECT_EQ(ClampDelayMs(-5), 0);
    EXPECT_EQ(ClampDelayMs(200), 200);
    EXPECT_EQ(ClampDelayMs(100000), 65535);
    EXPECT_EQ(MakeAnimationParams(100000, 0).delay_cs, 6553);
    EXPECT_EQ(MakeAnimationParams(200, 0).delay_cs, 20);
    EXPECT_EQ(MakeAnimationParams(5, 0).delay_cs, 0);
}

TEST(AnimationParamsTest, LoopCountMapping) {
    EXPECT_FALSE(LoopExtensionCount(1).has_value());
    EXPECT_EQ(LoopExtensionCount(0), 0);
    EXPECT_EQ(LoopExtensionCount(-5), 0);
    EXPECT_EQ(LoopExtensionCount(2), 1);
    EXPECT_EQ(LoopExtensionCount(101), 100);
    EXPECT_EQ(LoopExtensionCount(100000), 100);
}

TEST(GifWriterTest, PaletteIndexUsesCubeAndTransparentSlot) {
    EXPECT_EQ(PaletteIndex(0, 0, 0, 255), 0);
    EXPECT_EQ(PaletteIndex(255, 255, 255, 255), 215);
    EXPECT_EQ(PaletteIndex(255, 0, 0, 255), 180);
    EXPECT_EQ(PaletteIndex(255, 255, 255, 0), kTransparentIndex);
    EXPECT_EQ(PaletteIndex(10, 10, 10, 127), kTransparentIndex);
}

TEST(GifWriterTest, HeaderLoopExtensionAndFrameDelay) {
    gfx::Surface small(3, 2);
    gfx::Surface large(5, 4);
    const auto bytes = EncodeGif({&small, &large}, MakeAnimationParams(100000, -5));

    ASSERT_GT(bytes.size(), kScreenEnd + kNetscapeLength + 8);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 6), "GIF89a");
    EXPECT_EQ(WordAt(bytes, 6), 5);
    EXPECT_EQ(WordAt(bytes, 8), 4);
    EXPECT_EQ(bytes.back(), 0x3B);

    EXPECT_EQ(bytes[kScreenEnd], 0x21);
    EXPECT_EQ(bytes[kScreenEnd + 1], 0xFF);
    EXPECT_EQ(std::string(bytes.begin() + kScreenEnd + 3, bytes.begin() + kScreenEnd + 14), "NETSCAPE2.0");
    EXPECT_EQ(WordAt(bytes, kScreenEnd + 16), 0);

    const std::size_t gce = kScreenEnd + kNetscapeLength;
    EXPECT_EQ(bytes[gce], 0x21);
    EXPECT_EQ(bytes[gce + 1], 0xF9);
    EXPECT_EQ(WordAt(bytes, gce + 4), 6553);
    EXPECT_EQ(bytes[gce + 6], kTransparentIndex);
}

TEST(GifWriterTest, PerFrameDelaysOverrideTheDefault) {
    gfx::Surface a(2, 2);
    gfx::Surface b(3, 3);
    gfx::Surface c(2, 2);
    auto params = MakeAnimationParams(200, 0);
    params.frame_delays_cs = {5, 0};
    EXPECT_EQ(FrameDelays(EncodeGif({&a, &b, &c}, params)), (std::vector<std::uint16_t>{5, 0, 20}));
    EXPECT_EQ(FrameDelayCs(params, 1), 0);
    EXPECT_EQ(FrameDelayCs(params, 7), 20);
}

TEST(GifWriterTest, PlayOnceOmitsLoopExtension) {
    gfx::Surface frame(2, 2);
    const auto bytes = EncodeGif({&frame}, MakeAnimationParams(200, 1));
    EXPECT_EQ(bytes[kScreenEnd], 0x21);
    EXPECT_EQ(bytes[kScreenEnd + 1], 0xF9);
    EXPECT_EQ(WordAt(bytes, kScreenEnd + 4), 20);
}

TEST(GifWriterTest, EmptyFrameListIsAnError) {
    EXPECT_THROW(EncodeGif({}, AnimationParams{}), EncodeError);
}

TEST(GifWriterTest, ImageDataDecodesToPaletteIndices) {
    // Enough varied pixels to fill the code table and force a clear code.
    gfx::Surface frame(200, 150);
    unsigned seed = 12345;
    for (int y = 0; y < frame.Height(); ++y) {
        for (int x = 0; x < frame.Width(); ++x) {
            seed = seed * 1103515245u + 12345u;
            const int r = static_cast<int>((seed >> 16) & 0xFF);
            const int g = static_cast<int>((seed >> 8) & 0xFF);
            frame.SetAt(x, y, gfx::Color(r, g, (x * 7) & 0xFF, (y % 5 == 0) ? 0 : 255));
        }
    }
    const auto bytes = EncodeGif({&frame}, MakeAnimationParams(100, 0));

    std::vector<std::uint8_t> expected;
    const auto& pixels = frame.Pixels();
    for (std::size_t i = 0; i < pixels.size(); i += 4) {
        expected.push_back(PaletteIndex(pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3]));
    }
    const std::size_t descriptor = kScreenEnd + kNetscapeLength + 8;
    ASSERT_EQ(bytes[descriptor], 0x2C);
    EXPECT_EQ(WordAt(bytes, descriptor + 5), 200);
    EXPECT_EQ(WordAt(bytes, descriptor + 7), 150);
    EXPECT_EQ(DecodeFrameIndices(bytes, descriptor + 10), expected);
}

TEST_F(MediaFileTest, PngReadsBackWithSamePixels) {
    gfx::Surface surface(3, 2);
    surface.SetAt(0, 0, gfx::Color(255, 0, 0));
    surface.SetAt(2, 1, gfx::Color(0, 128, 255, 64));
    const auto path = dir_ / "out.png";
    WritePng(surface, path);

    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    ASSERT_NE(png_image_begin_read_from_file(&image, path.c_str()), 0) << image.message;
    image.format = PNG_FORMAT_RGBA;
    EXPECT_EQ(image.width, 3u);
    EXPECT_EQ(image.height, 2u);
    std::vector<std::uint8_t> pixels(PNG_IMAGE_SIZE(image));
    ASSERT_NE(png_image_finish_read(&image, nullptr, pixels.data(), 0, nullptr), 0) << image.message;
    EXPECT_EQ(pixels, surface.Pixels());
}

TEST_F(MediaFileTest, WritersReportUnwritablePaths) {
    gfx::Surface surface(1, 1);
    const auto missing = dir_ / "no_such_dir" / "out";
    EXPECT_THROW(WritePng(surface, missing.string() + ".png"), EncodeError);
    EXPECT_THROW(WriteGif({&surface}, AnimationParams{}, missing.string() + ".gif"), EncodeError);
}

}  // namespace
}  // namespace evalbox::media
