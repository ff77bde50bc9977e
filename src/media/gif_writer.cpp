#include "media/gif_writer.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include "media/encode_error.hpp"

namespace evalbox::media {

namespace {

constexpr int kMinCodeSize = 8;
constexpr std::uint16_t kClearCode = 1 << kMinCodeSize;
constexpr std::uint16_t kEndCode = kClearCode + 1;
constexpr std::uint16_t kMaxCode = 4095;

class ByteWriter {
public:
    void Byte(std::uint8_t value) { bytes_.push_back(value); }

    void Word(std::uint16_t value) {
        bytes_.push_back(static_cast<std::uint8_t>(value & 0xFF));
        bytes_.push_back(static_cast<std::uint8_t>(value >> 8));
    }

    void Text(const char* text) {
        while (*text != '\0') {
            bytes_.push_back(static_cast<std::uint8_t>(*text++));
        }
    }

    // Data sub-blocks of at most 255 bytes, then the block terminator.
    void SubBlocks(const std::vector<std::uint8_t>& data) {
        for (std::size_t pos = 0; pos < data.size(); pos += 255) {
            const std::size_t count = std::min<std::size_t>(255, data.size() - pos);
            bytes_.push_back(static_cast<std::uint8_t>(count));
            bytes_.insert(bytes_.end(), data.begin() + pos, data.begin() + pos + count);
        }
        bytes_.push_back(0);
    }

    std::vector<std::uint8_t> Take() { return std::move(bytes_); }

private:
    std::vector<std::uint8_t> bytes_;
};

class BitPacker {
public:
    void Write(std::uint32_t code, int width) {
        buffer_ |= code << bits_;
        bits_ += width;
        while (bits_ >= 8) {
            out_.push_back(static_cast<std::uint8_t>(buffer_ & 0xFF));
            buffer_ >>= 8;
            bits_ -= 8;
        }
    }

    std::vector<std::uint8_t> Finish() {
        if (bits_ > 0) {
            out_.push_back(static_cast<std::uint8_t>(buffer_ & 0xFF));
        }
        buffer_ = 0;
        bits_ = 0;
        return std::move(out_);
    }

private:
    std::uint32_t buffer_ = 0;
    int bits_ = 0;
    std::vector<std::uint8_t> out_;
};

// Variable-width LZW as GIF expects it: clear code first, width grows when the
// next free code no longer fits, and a clear is emitted when the table fills.
std::vector<std::uint8_t> LzwCompress(const std::vector<std::uint8_t>& indices) {
    std::vector<std::uint16_t> table(static_cast<std::size_t>(kMaxCode + 1) * 256, 0);
    BitPacker packer;
    int code_size = kMinCodeSize + 1;
    std::uint16_t max_code = kEndCode;

    packer.Write(kClearCode, code_size);
    if (indices.empty()) {
        packer.Write(kEndCode, code_size);
        return packer.Finish();
    }

    std::uint16_t current = indices.front();
    for (std::size_t i = 1; i < indices.size(); ++i) {
        const std::uint8_t next = indices[i];
        const std::size_t slot = static_cast<std::size_t>(current) * 256 + next;
        if (table[slot] != 0) {
            current = table[slot];
            continue;
        }
        packer.Write(current, code_size);
        table[slot] = ++max_code;
        if (max_code >= (1u << code_size)) {
            ++code_size;
        }
        if (max_code == kMaxCode) {
            packer.Write(kClearCode, code_size);
            std::fill(table.begin(), table.end(), 0);
            code_size = kMinCodeSize + 1;
            max_code = kEndCode;
        }
        current = next;
    }
    packer.Write(current, code_size);
    packer.Write(kEndCode, code_size);
    return packer.Finish();
}

std::uint8_t CubeLevel(std::uint8_t channel) {
    return static_cast<std::uint8_t>((channel * (kCubeLevels - 1) + 127) / 255);
}

void WritePalette(ByteWriter& out) {
    for (int r = 0; r < kCubeLevels; ++r) {
        for (int g = 0; g < kCubeLevels; ++g) {
            for (int b = 0; b < kCubeLevels; ++b) {
                out.Byte(static_cast<std::uint8_t>(r * 255 / (kCubeLevels - 1)));
                out.Byte(static_cast<std::uint8_t>(g * 255 / (kCubeLevels - 1)));
                out.Byte(static_cast<std::uint8_t>(b * 255 / (kCubeLevels - 1)));
            }
        }
    }
    for (int i = kTransparentIndex; i < 256; ++i) {
        out.Byte(0);
        out.Byte(0);
        out.Byte(0);
    }
}

}  // namespace

std::uint8_t PaletteIndex(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    if (a < 128) {
        return kTransparentIndex;
    }
    return static_cast<std::uint8_t>(CubeLevel(r) * kCubeLevels * kCubeLevels +
                                     CubeLevel(g) * kCubeLevels + CubeLevel(b));
}

std::vector<std::uint8_t> EncodeGif(const std::vector<const gfx::Surface*>& frames,
                                    const AnimationParams& params) {
    if (frames.empty()) {
        throw EncodeError("an animation needs at least one frame");
    }
    int screen_w = 1;
    int screen_h = 1;
    for (const auto* frame : frames) {
        screen_w = std::max(screen_w, frame->Width());
        screen_h = std::max(screen_h, frame->Height());
    }

    ByteWriter out;
    out.Text("GIF89a");
    out.Word(static_cast<std::uint16_t>(screen_w));
    out.Word(static_cast<std::uint16_t>(screen_h));
    out.Byte(0xF7);  // global table, 8 bits per channel, 256 entries
    out.Byte(kTransparentIndex);
    out.Byte(0);
    WritePalette(out);

    if (params.loop_count.has_value()) {
        out.Byte(0x21);
        out.Byte(0xFF);
        out.Byte(11);
        out.Text("NETSCAPE2.0");
        out.Byte(3);
        out.Byte(1);
        out.Word(*params.loop_count);
        out.Byte(0);
    }

    for (std::size_t index = 0; index < frames.size(); ++index) {
        const auto* frame = frames[index];
        out.Byte(0x21);
        out.Byte(0xF9);
        out.Byte(4);
        out.Byte(0x09);  // dispose to background, transparent index present
        out.Word(FrameDelayCs(params, index));
        out.Byte(kTransparentIndex);
        out.Byte(0);

        out.Byte(0x2C);
        out.Word(0);
        out.Word(0);
        out.Word(static_cast<std::uint16_t>(frame->Width()));
        out.Word(static_cast<std::uint16_t>(frame->Height()));
        out.Byte(0);

        const auto& pixels = frame->Pixels();
        std::vector<std::uint8_t> indices;
        indices.reserve(pixels.size() / 4);
        for (std::size_t i = 0; i + 3 < pixels.size(); i += 4) {
            indices.push_back(PaletteIndex(pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3]));
        }
        out.Byte(kMinCodeSize);
        out.SubBlocks(LzwCompress(indices));
    }

    out.Byte(0x3B);
    return out.Take();
}

void WriteGif(const std::vector<const gfx::Surface*>& frames,
              const AnimationParams& params,
              const std::filesystem::path& path) {
    const auto bytes = EncodeGif(frames, params);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw EncodeError("failed to open " + path.string() + " for writing");
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        throw EncodeError("failed to write " + path.string());
    }
}

}  // namespace evalbox::media
