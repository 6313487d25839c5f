module;
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

module Graphics:Material.Impl;
import :Material;

namespace Graphics
{
    std::string_view TextureSlotToString(TextureSlot slot)
    {
        switch (slot)
        {
            case TextureSlot::Map:                   return "map";
            case TextureSlot::AlphaMap:              return "alphaMap";
            case TextureSlot::AoMap:                 return "aoMap";
            case TextureSlot::BumpMap:               return "bumpMap";
            case TextureSlot::DisplacementMap:       return "displacementMap";
            case TextureSlot::EmissiveMap:           return "emissiveMap";
            case TextureSlot::EnvMap:                return "envMap";
            case TextureSlot::LightMap:              return "lightMap";
            case TextureSlot::MetalnessMap:          return "metalnessMap";
            case TextureSlot::NormalMap:             return "normalMap";
            case TextureSlot::RoughnessMap:          return "roughnessMap";
            case TextureSlot::SpecularMap:           return "specularMap";
            case TextureSlot::ClearcoatMap:          return "clearcoatMap";
            case TextureSlot::ClearcoatNormalMap:    return "clearcoatNormalMap";
            case TextureSlot::ClearcoatRoughnessMap: return "clearcoatRoughnessMap";
            case TextureSlot::Matcap:                return "matcap";
        }
        return "unknown";
    }

    std::string_view Material::TypeName() const
    {
        switch (Params.index())
        {
            case 0: return "Basic";
            case 1: return "Lambert";
            case 2: return "Phong";
            case 3: return "Standard";
            case 4: return "Physical";
            case 5: return "Toon";
            case 6: return "Points";
            default: return "LineBasic";
        }
    }

    std::vector<std::string> Material::TextureIds() const
    {
        std::vector<std::string> ids;
        for (const auto& [slot, id] : Textures)
        {
            if (id.empty()) continue;
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
        }
        return ids;
    }
}
