#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Graphics;
import Runtime.World;

#include "TestHelpers.h"

// ---------------------------------------------------------------------------
// Compile-time API contract
// ---------------------------------------------------------------------------

TEST(World, NotCopyableOrMovable)
{
    static_assert(!std::is_copy_constructible_v<Runtime::World>);
    static_assert(!std::is_move_constructible_v<Runtime::World>);
    static_assert(std::is_default_constructible_v<Runtime::World>);
    SUCCEED();
}

class WorldRegistryTest : public ::testing::Test
{
protected:
    Graphics::NullRenderer m_Sink;
    Runtime::World m_World;
};

// ---------------------------------------------------------------------------
// Create / Get / duplicate ids, per kind
// ---------------------------------------------------------------------------

TEST_F(WorldRegistryTest, Camera_CreateGetDuplicate)
{
    auto cam = m_World.CreateCamera("cam1");
    ASSERT_TRUE(cam.has_value());
    EXPECT_EQ(m_World.GetCamera("cam1"), *cam);

    LogCapture logs;
    auto again = m_World.CreateCamera("cam1");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::DuplicateId);
    EXPECT_GE(logs.Errors(), 1u);
    EXPECT_EQ(m_World.GetAllCameras().size(), 1u);
}

TEST_F(WorldRegistryTest, Camera_DefaultsAndViewportAspect)
{
    m_World.SetViewport(800, 400);
    auto cam = m_World.CreateCamera(std::nullopt);
    ASSERT_TRUE(cam.has_value());

    EXPECT_FLOAT_EQ((*cam)->Fov, 45.0f);
    EXPECT_FLOAT_EQ((*cam)->Near, 0.1f);
    EXPECT_FLOAT_EQ((*cam)->Far, 1000.0f);
    EXPECT_FLOAT_EQ((*cam)->AspectRatio, 2.0f);
    EXPECT_EQ((*cam)->Id.rfind("camera-", 0), 0u);
}

TEST_F(WorldRegistryTest, Scene_CreateGetDuplicate)
{
    ASSERT_TRUE(m_World.CreateScene("s1").has_value());
    auto again = m_World.CreateScene("s1");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::DuplicateId);
    EXPECT_NE(m_World.GetScene("s1"), nullptr);
}

TEST_F(WorldRegistryTest, Group_CreateGetDuplicate)
{
    ASSERT_TRUE(m_World.CreateGroup("g1").has_value());
    EXPECT_EQ(m_World.CreateGroup("g1").error(), Core::ErrorCode::DuplicateId);
    EXPECT_TRUE(m_World.HasGroup("g1"));
}

TEST_F(WorldRegistryTest, Geometry_CreateGetDuplicate)
{
    auto geo = m_World.CreateGeometry({"box", Graphics::BoxParams{}});
    ASSERT_TRUE(geo.has_value());
    EXPECT_EQ((*geo)->VertexCount(), 24u);
    EXPECT_EQ((*geo)->TypeName(), "Box");
    EXPECT_EQ(m_World.GetGeometry("box"), *geo);

    EXPECT_EQ(m_World.CreateGeometry({"box", Graphics::SphereParams{}}).error(), Core::ErrorCode::DuplicateId);
}

TEST_F(WorldRegistryTest, Geometry_InvalidParamsCreateNothing)
{
    LogCapture logs;
    auto geo = m_World.CreateGeometry({"bad", Graphics::PlaneParams{.Width = -2.0f}});
    ASSERT_FALSE(geo.has_value());
    EXPECT_EQ(geo.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_FALSE(m_World.HasGeometry("bad"));
}

TEST_F(WorldRegistryTest, Material_CreateGetDuplicate)
{
    Graphics::MaterialDesc desc{.Id = "mat", .Params = Graphics::PhysicalParams{.Clearcoat = 1.0f}};
    auto mat = m_World.CreateMaterial(desc);
    ASSERT_TRUE(mat.has_value());
    EXPECT_EQ((*mat)->TypeName(), "Physical");
    EXPECT_EQ(m_World.CreateMaterial(desc).error(), Core::ErrorCode::DuplicateId);
}

TEST_F(WorldRegistryTest, Texture_CreateValidatesPixels)
{
    Graphics::TextureDesc desc;
    desc.Id = "tex";
    desc.Width = 1;
    desc.Height = 1;
    desc.Pixels = {255, 0, 0, 255};
    ASSERT_TRUE(m_World.CreateTexture(desc).has_value());
    EXPECT_TRUE(m_World.GetTexture("tex")->HasData());

    Graphics::TextureDesc bad = desc;
    bad.Id = "bad";
    bad.Pixels = {1, 2, 3};
    LogCapture logs;
    EXPECT_EQ(m_World.CreateTexture(bad).error(), Core::ErrorCode::InvalidArgument);
    EXPECT_FALSE(m_World.HasTexture("bad"));
}

TEST_F(WorldRegistryTest, Texture_UploadReplacesPixels)
{
    Graphics::TextureDesc desc;
    desc.Id = "late";
    ASSERT_TRUE(m_World.CreateTexture(desc).has_value());

    Graphics::Texture* texture = m_World.GetTexture("late");
    EXPECT_FALSE(texture->HasData());
    ASSERT_TRUE(Graphics::UploadPixels(*texture, 2, 1, std::vector<uint8_t>(8, 7)).has_value());
    EXPECT_EQ(texture->Width, 2u);
    EXPECT_EQ(texture->Version, 1u);
}

TEST_F(WorldRegistryTest, Light_CreateGetDuplicate)
{
    auto light = m_World.CreateLight({"sun", Graphics::DirectionalLightParams{}});
    ASSERT_TRUE(light.has_value());
    EXPECT_EQ((*light)->TypeName(), "Directional");
    EXPECT_EQ(m_World.CreateLight({"sun", Graphics::AmbientLightParams{}}).error(), Core::ErrorCode::DuplicateId);
}

// ---------------------------------------------------------------------------
// Meshes
// ---------------------------------------------------------------------------

TEST_F(WorldRegistryTest, Mesh_ByIds)
{
    ASSERT_TRUE(m_World.CreateGeometry({"geo", Graphics::BoxParams{}}).has_value());
    ASSERT_TRUE(m_World.CreateMaterial({.Id = "mat"}).has_value());

    auto mesh = m_World.CreateMesh({.Id = "m1", .Geometry = std::string("geo"), .Materials = {std::string("mat")}});
    ASSERT_TRUE(mesh.has_value());
    EXPECT_EQ((*mesh)->GeometryId, "geo");
    EXPECT_EQ((*mesh)->MaterialIds, (std::vector<std::string>{"mat"}));
    EXPECT_FALSE((*mesh)->IsMultiMaterial());
}

TEST_F(WorldRegistryTest, Mesh_InlineDescriptorsAreRegistered)
{
    Graphics::MeshDesc desc;
    desc.Id = "ball";
    desc.Geometry = Graphics::GeometryDesc{"ballGeo", Graphics::SphereParams{}};
    desc.Materials = {Graphics::MaterialDesc{.Id = "ballMat"}, Graphics::MaterialDesc{}};
    desc.CastShadow = true;

    auto mesh = m_World.CreateMesh(desc);
    ASSERT_TRUE(mesh.has_value());
    EXPECT_TRUE(m_World.HasGeometry("ballGeo"));
    EXPECT_TRUE(m_World.HasMaterial("ballMat"));
    ASSERT_EQ((*mesh)->MaterialIds.size(), 2u);
    EXPECT_TRUE(m_World.HasMaterial((*mesh)->MaterialIds[1]));
    EXPECT_TRUE((*mesh)->IsMultiMaterial());
    EXPECT_TRUE((*mesh)->CastShadow);
}

TEST_F(WorldRegistryTest, Mesh_UnknownReferenceCreatesNothing)
{
    LogCapture logs;
    Graphics::MeshDesc desc;
    desc.Id = "m1";
    desc.Geometry = Graphics::GeometryDesc{"inlineGeo", Graphics::BoxParams{}};
    desc.Materials = {Graphics::MaterialDesc{.Id = "inlineMat"}, std::string("missingMat")};

    auto mesh = m_World.CreateMesh(desc);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_FALSE(m_World.HasGeometry("inlineGeo"));
    EXPECT_FALSE(m_World.HasMaterial("inlineMat"));
    EXPECT_FALSE(m_World.HasMesh("m1"));
}

TEST_F(WorldRegistryTest, Mesh_DuplicateIdCreatesNothing)
{
    ASSERT_TRUE(m_World.CreateMesh({.Id = "m1", .Geometry = Graphics::GeometryDesc{}, .Materials = {Graphics::MaterialDesc{}}}).has_value());
    const size_t geometries = m_World.GetAllGeometries().size();

    LogCapture logs;
    auto again = m_World.CreateMesh({.Id = "m1", .Geometry = Graphics::GeometryDesc{}, .Materials = {Graphics::MaterialDesc{}}});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::DuplicateId);
    EXPECT_EQ(m_World.GetAllGeometries().size(), geometries);
}

// ---------------------------------------------------------------------------
// Lookup / delete semantics shared by all kinds
// ---------------------------------------------------------------------------

TEST_F(WorldRegistryTest, GetManyIsPositional)
{
    ASSERT_TRUE(m_World.CreateLight({"a", Graphics::AmbientLightParams{}}).has_value());
    ASSERT_TRUE(m_World.CreateLight({"c", Graphics::PointLightParams{}}).has_value());

    LogCapture logs;
    auto lights = m_World.GetLights({"a", "b", "c"});
    ASSERT_EQ(lights.size(), 3u);
    EXPECT_NE(lights[0], nullptr);
    EXPECT_EQ(lights[1], nullptr);
    EXPECT_EQ(lights[2]->Id, "c");
    EXPECT_EQ(logs.Warnings(), 1u);
}

TEST_F(WorldRegistryTest, DeleteThenGetReturnsNull)
{
    ASSERT_TRUE(m_World.CreateCamera("cam").has_value());
    m_World.DeleteCamera("cam");

    LogCapture logs;
    EXPECT_EQ(m_World.GetCamera("cam"), nullptr);
    EXPECT_EQ(logs.Warnings(), 1u);
}

TEST_F(WorldRegistryTest, DeleteUnknownWarnsPerIdAndContinues)
{
    ASSERT_TRUE(m_World.CreateTexture({.Id = "t1"}).has_value());
    ASSERT_TRUE(m_World.CreateTexture({.Id = "t2"}).has_value());

    LogCapture logs;
    m_World.DeleteTextures({"t1", "nope", "t2", "nope2"});
    EXPECT_EQ(logs.Warnings(), 2u);
    EXPECT_TRUE(m_World.GetAllTextures().empty());
}

TEST_F(WorldRegistryTest, GeneratedIdsDoNotCollideWithExplicitOnes)
{
    ASSERT_TRUE(m_World.CreateGroup("group-1").has_value());
    auto generated = m_World.CreateGroup(std::nullopt);
    ASSERT_TRUE(generated.has_value());
    EXPECT_NE((*generated)->Id, "group-1");
    EXPECT_EQ(m_World.GetAllGroups().size(), 2u);
}

TEST_F(WorldRegistryTest, GpuHooksSeeEveryDisposal)
{
    m_World.ConnectGpuHooks(m_Sink);

    ASSERT_TRUE(m_World.CreateGeometry({"g", Graphics::BoxParams{}}).has_value());
    ASSERT_TRUE(m_World.CreateTexture({.Id = "t"}).has_value());
    m_World.DeleteGeometry("g");
    m_World.DeleteTexture("t");

    ASSERT_EQ(m_Sink.GetDisposed().size(), 2u);
    EXPECT_EQ(m_Sink.GetDisposed()[0].first, Graphics::ResourceKind::Geometry);
    EXPECT_EQ(m_Sink.GetDisposed()[1].second, "t");

    m_World.DisconnectGpuHooks();
    ASSERT_TRUE(m_World.CreateTexture({.Id = "t2"}).has_value());
    m_World.DeleteTexture("t2");
    EXPECT_EQ(m_Sink.GetDisposed().size(), 2u);
}
