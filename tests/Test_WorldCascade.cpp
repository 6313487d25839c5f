#include <gtest/gtest.h>
#include <string>
#include <vector>

import Core;
import Graphics;
import Runtime.World;

#include "TestHelpers.h"

class WorldCascadeTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_World.CreateGeometry({"shared", Graphics::SphereParams{}}).has_value());
        ASSERT_TRUE(m_World.CreateTexture({.Id = "albedo"}).has_value());
        ASSERT_TRUE(m_World.CreateTexture({.Id = "normal"}).has_value());

        Graphics::MaterialDesc textured{.Id = "textured", .Params = Graphics::StandardParams{}};
        textured.Textures[Graphics::TextureSlot::Map] = "albedo";
        textured.Textures[Graphics::TextureSlot::NormalMap] = "normal";
        textured.Textures[Graphics::TextureSlot::EmissiveMap] = "albedo";
        ASSERT_TRUE(m_World.CreateMaterial(textured).has_value());
        ASSERT_TRUE(m_World.CreateMaterial({.Id = "plain"}).has_value());

        ASSERT_TRUE(m_World.CreateMesh({.Id = "m1", .Geometry = std::string("shared"), .Materials = {std::string("textured")}}).has_value());
        ASSERT_TRUE(m_World.CreateMesh({.Id = "m2", .Geometry = std::string("shared"), .Materials = {std::string("plain")}}).has_value());
    }

    // Declared first so it outlives the world's teardown disposals
    Graphics::NullRenderer m_Sink;
    Runtime::World m_World;
};

TEST_F(WorldCascadeTest, DeleteMeshDefaultKeepsReferences)
{
    m_World.DeleteMesh("m1");
    EXPECT_FALSE(m_World.HasMesh("m1"));
    EXPECT_TRUE(m_World.HasGeometry("shared"));
    EXPECT_TRUE(m_World.HasMaterial("textured"));
}

TEST_F(WorldCascadeTest, SharedGeometryIsNotReferenceCounted)
{
    m_World.DeleteMesh("m1", {.DeleteGeometries = true});

    LogCapture logs;
    EXPECT_EQ(m_World.GetGeometry("shared"), nullptr);
    EXPECT_EQ(logs.Warnings(), 1u);

    // m2 survives with a dangling reference
    ASSERT_NE(m_World.GetMesh("m2"), nullptr);
    EXPECT_EQ(m_World.GetMesh("m2")->GeometryId, "shared");
}

TEST_F(WorldCascadeTest, DeleteMaterialsKeepsTexturesUnlessAsked)
{
    m_World.DeleteMesh("m1", {.DeleteMaterials = true});
    EXPECT_FALSE(m_World.HasMaterial("textured"));
    EXPECT_TRUE(m_World.HasTexture("albedo"));
    EXPECT_TRUE(m_World.HasTexture("normal"));
}

TEST_F(WorldCascadeTest, DeleteMaterialsWithTextures)
{
    Runtime::CascadeOptions options;
    options.DeleteMaterials = true;
    options.DeleteTextures = true;

    LogCapture logs;
    m_World.DeleteMesh("m1", options);

    EXPECT_FALSE(m_World.HasTexture("albedo"));
    EXPECT_FALSE(m_World.HasTexture("normal"));
    // The duplicated slot reference is deleted once
    EXPECT_EQ(logs.Warnings(), 0u);
}

TEST_F(WorldCascadeTest, DeleteAllImpliesTextures)
{
    m_World.DeleteMesh("m1", {.DeleteAll = true});
    EXPECT_FALSE(m_World.HasGeometry("shared"));
    EXPECT_FALSE(m_World.HasMaterial("textured"));
    EXPECT_FALSE(m_World.HasTexture("albedo"));
    EXPECT_TRUE(m_World.HasMaterial("plain"));
}

TEST_F(WorldCascadeTest, DeleteAllWithExplicitTextureOptOut)
{
    Runtime::CascadeOptions options;
    options.DeleteAll = true;
    options.DeleteTextures = false;
    m_World.DeleteMesh("m1", options);

    EXPECT_FALSE(m_World.HasMaterial("textured"));
    EXPECT_TRUE(m_World.HasTexture("albedo"));
}

TEST_F(WorldCascadeTest, DeleteMaterialDirectly)
{
    m_World.DeleteMaterial("textured", true);
    EXPECT_FALSE(m_World.HasTexture("albedo"));
    EXPECT_FALSE(m_World.HasTexture("normal"));
}

TEST_F(WorldCascadeTest, DisposedFlagsAndGpuNotificationOrder)
{
    m_World.ConnectGpuHooks(m_Sink);

    m_World.DeleteMesh("m1", {.DeleteAll = true});

    const auto& disposed = m_Sink.GetDisposed();
    ASSERT_EQ(disposed.size(), 5u);
    EXPECT_EQ(disposed[0].first, Graphics::ResourceKind::Mesh);
    EXPECT_EQ(disposed[1].first, Graphics::ResourceKind::Geometry);
    EXPECT_EQ(disposed[2].first, Graphics::ResourceKind::Material);
    EXPECT_EQ(disposed[3].second, "albedo");
    EXPECT_EQ(disposed[4].second, "normal");
}

TEST_F(WorldCascadeTest, ClearDisposesEverything)
{
    m_World.ConnectGpuHooks(m_Sink);
    ASSERT_TRUE(m_World.CreateCamera("cam").has_value());
    ASSERT_TRUE(m_World.CreateScene("scene").has_value());

    m_World.Clear();

    EXPECT_TRUE(m_World.GetAllMeshes().empty());
    EXPECT_TRUE(m_World.GetAllTextures().empty());
    EXPECT_TRUE(m_World.GetAllCameras().empty());
    EXPECT_EQ(m_World.GetCurrentScene(), nullptr);
    EXPECT_EQ(m_Sink.GetDisposed().size(), 9u);
    EXPECT_TRUE(m_World.GetTree().valid(m_World.GetRootNode()));
}
