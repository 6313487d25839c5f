module;
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

module Graphics:Texture.Impl;
import :Texture;
import Core;

namespace Graphics
{
    uint32_t BytesPerPixel(PixelFormat format)
    {
        switch (format)
        {
            case PixelFormat::R8:      return 1;
            case PixelFormat::RG8:     return 2;
            case PixelFormat::RGB8:    return 3;
            case PixelFormat::RGBA8:   return 4;
            case PixelFormat::RGBA16F: return 8;
            case PixelFormat::RGBA32F: return 16;
        }
        return 4;
    }

    Core::Result ValidateTexture(const TextureDesc& desc)
    {
        if (desc.Pixels.empty()) return Core::Ok();

        const size_t expected = (size_t)desc.Width * desc.Height * BytesPerPixel(desc.Format);
        if (desc.Pixels.size() != expected)
        {
            Core::Log::Error("Texture pixel data size {} does not match {}x{} (expected {} bytes)",
                             desc.Pixels.size(), desc.Width, desc.Height, expected);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        return Core::Ok();
    }

    Core::Result UploadPixels(Texture& texture, uint32_t width, uint32_t height, std::vector<uint8_t> pixels)
    {
        if (texture.Disposed)
        {
            Core::Log::Warn("Cannot upload pixels to disposed texture '{}'", texture.Id);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        const size_t expected = (size_t)width * height * BytesPerPixel(texture.Format);
        if (pixels.size() != expected)
        {
            Core::Log::Error("Texture '{}' upload size {} does not match {}x{} (expected {} bytes)",
                             texture.Id, pixels.size(), width, height, expected);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        texture.Width = width;
        texture.Height = height;
        texture.Pixels = std::move(pixels);
        ++texture.Version;
        return Core::Ok();
    }

    void Texture::Dispose()
    {
        Pixels.clear();
        Pixels.shrink_to_fit();
        Disposed = true;
    }
}
