#pragma once

/*
    EMBER UI САН

    ФАЙЛ: texture_loader_tga.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: TGA (truecolor/grayscale, шахаагүй болон RLE) зургийг file interface-ээр
            уншиж Texture2DData болгоно.
*/


#include <cstdint>
#include <string>
#include <vector>

#include "ember/core/result.hpp"
#include "ember/interfaces/file_interface.hpp"
#include "ember/resources/texture.hpp"

namespace ember
{
    namespace detail
    {
        inline uint16_t read_le16(const uint8_t* p)
        {
            return (uint16_t)(p[0] | (p[1] << 8));
        }

        inline Color tga_pixel(const uint8_t* p, int bytes_per_pixel)
        {
            switch (bytes_per_pixel)
            {
                case 1: return Color{p[0], p[0], p[0], 255};
                case 3: return Color{p[2], p[1], p[0], 255};
                case 4: return Color{p[2], p[1], p[0], p[3]};
            }
            return Color{0, 0, 0, 255};
        }
    }

    inline Result<Texture2DData> decode_texture2d_tga(const std::vector<uint8_t>& bytes, const std::string& source_name = {})
    {
        constexpr size_t kHeaderSize = 18;
        if (bytes.size() < kHeaderSize) return Result<Texture2DData>::failure("TGA header truncated: " + source_name);

        const uint8_t id_length = bytes[0];
        const uint8_t colormap_type = bytes[1];
        const uint8_t image_type = bytes[2];
        const int w = detail::read_le16(&bytes[12]);
        const int h = detail::read_le16(&bytes[14]);
        const int bpp = bytes[16];
        const uint8_t descriptor = bytes[17];

        if (colormap_type != 0) return Result<Texture2DData>::failure("Colour-mapped TGA is not supported: " + source_name);

        const bool rle = image_type == 10 || image_type == 11;
        const bool grey = image_type == 3 || image_type == 11;
        const bool truecolor = image_type == 2 || image_type == 10;
        if (!grey && !truecolor) return Result<Texture2DData>::failure("Unsupported TGA image type " + std::to_string(image_type) + ": " + source_name);
        if (grey && bpp != 8) return Result<Texture2DData>::failure("Greyscale TGA must be 8 bpp: " + source_name);
        if (truecolor && bpp != 24 && bpp != 32) return Result<Texture2DData>::failure("Truecolor TGA must be 24 or 32 bpp: " + source_name);
        if (w <= 0 || h <= 0) return Result<Texture2DData>::failure("TGA has empty dimensions: " + source_name);

        const int bytes_per_pixel = bpp / 8;
        const size_t pixel_count = (size_t)w * (size_t)h;
        size_t pos = kHeaderSize + id_length;

        // Header dimensions are untrusted: nothing is allocated until the
        // file holds enough data to back them.
        if (bytes.size() <= pos) return Result<Texture2DData>::failure("TGA pixel data truncated: " + source_name);
        const size_t payload = bytes.size() - pos;

        std::vector<Color> decoded{};
        if (!rle)
        {
            if (payload / (size_t)bytes_per_pixel < pixel_count)
            {
                return Result<Texture2DData>::failure("TGA pixel data truncated: " + source_name);
            }
            decoded.reserve(pixel_count);
            for (size_t i = 0; i < pixel_count; ++i)
            {
                decoded.push_back(detail::tga_pixel(&bytes[pos], bytes_per_pixel));
                pos += (size_t)bytes_per_pixel;
            }
        }
        else
        {
            // A packet of 1 + bytes_per_pixel bytes expands to at most 128 pixels.
            const size_t max_pixels = payload / (size_t)(1 + bytes_per_pixel) * 128u + 128u;
            if (max_pixels < pixel_count) return Result<Texture2DData>::failure("TGA RLE data truncated: " + source_name);
            while (decoded.size() < pixel_count)
            {
                if (pos >= bytes.size()) return Result<Texture2DData>::failure("TGA RLE data truncated: " + source_name);
                const uint8_t packet = bytes[pos++];
                const size_t count = (size_t)(packet & 0x7F) + 1;
                if (decoded.size() + count > pixel_count) return Result<Texture2DData>::failure("TGA RLE packet overruns image: " + source_name);

                if (packet & 0x80)
                {
                    if (pos + (size_t)bytes_per_pixel > bytes.size()) return Result<Texture2DData>::failure("TGA RLE data truncated: " + source_name);
                    const Color c = detail::tga_pixel(&bytes[pos], bytes_per_pixel);
                    pos += (size_t)bytes_per_pixel;
                    decoded.insert(decoded.end(), count, c);
                }
                else
                {
                    if (pos + count * (size_t)bytes_per_pixel > bytes.size()) return Result<Texture2DData>::failure("TGA RLE data truncated: " + source_name);
                    for (size_t i = 0; i < count; ++i)
                    {
                        decoded.push_back(detail::tga_pixel(&bytes[pos], bytes_per_pixel));
                        pos += (size_t)bytes_per_pixel;
                    }
                }
            }
        }

        // Descriptor bit 5 set means the first stored row is the top row.
        const bool top_origin = (descriptor & 0x20) != 0;
        Texture2DData out{w, h};
        out.source_path = source_name;
        for (int y = 0; y < h; ++y)
        {
            const int src_y = top_origin ? y : (h - 1 - y);
            for (int x = 0; x < w; ++x)
            {
                out.at(x, y) = decoded[(size_t)src_y * (size_t)w + (size_t)x];
            }
        }
        return Result<Texture2DData>::success(std::move(out));
    }

    inline Result<Texture2DData> load_texture2d_tga(IFileInterface& files, const std::string& path)
    {
        std::vector<uint8_t> bytes{};
        if (!read_file_to_vector(files, path, bytes))
        {
            return Result<Texture2DData>::failure("Cannot read TGA file: " + path);
        }
        return decode_texture2d_tga(bytes, path);
    }
}
