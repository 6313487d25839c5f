module;
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

export module Graphics:Texture;

import Core;

export namespace Graphics
{
    enum class TextureWrap : uint8_t
    {
        Repeat,
        ClampToEdge,
        MirroredRepeat
    };

    enum class TextureFilter : uint8_t
    {
        Nearest,
        Linear,
        NearestMipmapNearest,
        NearestMipmapLinear,
        LinearMipmapNearest,
        LinearMipmapLinear
    };

    enum class PixelFormat : uint8_t
    {
        R8,
        RG8,
        RGB8,
        RGBA8,
        RGBA16F,
        RGBA32F
    };

    enum class ColorSpace : uint8_t
    {
        None,
        SRGB,
        Linear
    };

    struct SamplerOptions
    {
        TextureWrap WrapS = TextureWrap::ClampToEdge;
        TextureWrap WrapT = TextureWrap::ClampToEdge;
        TextureFilter MagFilter = TextureFilter::Linear;
        TextureFilter MinFilter = TextureFilter::LinearMipmapLinear;
        uint32_t Anisotropy = 1;
        bool FlipY = true;
        bool GenerateMipmaps = true;
        ColorSpace Space = ColorSpace::None;
    };

    // Pixels may be empty: the texture is then a placeholder whose data
    // arrives later (e.g. from an async load).
    struct TextureDesc
    {
        std::optional<std::string> Id;
        uint32_t Width = 0;
        uint32_t Height = 0;
        PixelFormat Format = PixelFormat::RGBA8;
        std::vector<uint8_t> Pixels;
        SamplerOptions Sampler;
    };

    struct Texture
    {
        std::string Id;
        uint32_t Width = 0;
        uint32_t Height = 0;
        PixelFormat Format = PixelFormat::RGBA8;
        std::vector<uint8_t> Pixels;
        SamplerOptions Sampler;
        uint32_t Version = 0; // Bumped whenever Pixels change
        bool Disposed = false;

        [[nodiscard]] bool HasData() const { return !Pixels.empty(); }

        void Dispose();
    };

    [[nodiscard]] uint32_t BytesPerPixel(PixelFormat format);

    // Non-empty pixel data must be exactly Width * Height * BytesPerPixel.
    [[nodiscard]] Core::Result ValidateTexture(const TextureDesc& desc);

    // Replaces pixel data in place, keeping sampler settings and id.
    [[nodiscard]] Core::Result UploadPixels(Texture& texture, uint32_t width, uint32_t height, std::vector<uint8_t> pixels);
}
