#include "media/png_writer.hpp"

#include <cstring>
#include <png.h>

#include "media/encode_error.hpp"

namespace evalbox::media {

void WritePng(const gfx::Surface& surface, const std::filesystem::path& path) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(surface.Width());
    image.height = static_cast<png_uint_32>(surface.Height());
    image.format = PNG_FORMAT_RGBA;

    const std::string file = path.string();
    if (png_image_write_to_file(&image, file.c_str(), 0, surface.Pixels().data(), 0, nullptr) == 0) {
        const std::string message = image.message;
        png_image_free(&image);
        throw EncodeError("failed to write " + file + ": " + message);
    }
}

}  // namespace evalbox::media
