module;
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Material;

export namespace Graphics
{
    enum class MaterialSide : uint8_t
    {
        Front,
        Back,
        Double
    };

    // Properties every material kind shares.
    struct MaterialCommon
    {
        glm::vec3 Color{1.0f};
        float Opacity = 1.0f;
        bool Transparent = false;
        bool Wireframe = false;
        bool DepthTest = true;
        bool DepthWrite = true;
        MaterialSide Side = MaterialSide::Front;
    };

    // --- Kind specific parameters ---------------------------------------------

    struct BasicParams
    {
        float Reflectivity = 1.0f;
    };

    struct LambertParams
    {
        glm::vec3 Emissive{0.0f};
        float EmissiveIntensity = 1.0f;
    };

    struct PhongParams
    {
        glm::vec3 Specular{0.0667f};
        float Shininess = 30.0f;
        glm::vec3 Emissive{0.0f};
        float EmissiveIntensity = 1.0f;
    };

    struct StandardParams
    {
        float Roughness = 1.0f;
        float Metalness = 0.0f;
        glm::vec3 Emissive{0.0f};
        float EmissiveIntensity = 1.0f;
        float EnvMapIntensity = 1.0f;
    };

    struct PhysicalParams
    {
        StandardParams Standard;
        float Clearcoat = 0.0f;
        float ClearcoatRoughness = 0.0f;
        float Transmission = 0.0f;
        float Ior = 1.5f;
        float Sheen = 0.0f;
        float Iridescence = 0.0f;
    };

    struct ToonParams
    {
        glm::vec3 Emissive{0.0f};
    };

    struct PointsParams
    {
        float Size = 1.0f;
        bool SizeAttenuation = true;
    };

    struct LineBasicParams
    {
        float LineWidth = 1.0f;
    };

    using MaterialParams = std::variant<BasicParams, LambertParams, PhongParams, StandardParams,
                                        PhysicalParams, ToonParams, PointsParams, LineBasicParams>;

    // Named texture inputs. A slot holds a texture registry id.
    enum class TextureSlot : uint8_t
    {
        Map,
        AlphaMap,
        AoMap,
        BumpMap,
        DisplacementMap,
        EmissiveMap,
        EnvMap,
        LightMap,
        MetalnessMap,
        NormalMap,
        RoughnessMap,
        SpecularMap,
        ClearcoatMap,
        ClearcoatNormalMap,
        ClearcoatRoughnessMap,
        Matcap
    };

    [[nodiscard]] std::string_view TextureSlotToString(TextureSlot slot);

    using TextureSlots = std::map<TextureSlot, std::string>;

    struct MaterialDesc
    {
        std::optional<std::string> Id;
        MaterialParams Params = BasicParams{};
        MaterialCommon Common;
        TextureSlots Textures;
    };

    struct Material
    {
        std::string Id;
        MaterialParams Params;
        MaterialCommon Common;
        TextureSlots Textures;
        bool Disposed = false;

        [[nodiscard]] std::string_view TypeName() const;

        // Texture ids in slot order. Duplicates (one texture in two slots)
        // are reported once.
        [[nodiscard]] std::vector<std::string> TextureIds() const;

        void Dispose() { Disposed = true; }
    };
}
