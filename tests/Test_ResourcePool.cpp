#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <memory>

#include <vecarrows/runtime/engine/GameInstance.hpp>
#include <vecarrows/runtime/mesh/Primitives.hpp>
#include <vecarrows/runtime/rendering/MeshRenderer.hpp>
#include <vecarrows/runtime/resources/MemoryResourcePool.hpp>

using namespace VecArrows;

namespace {
void ExpectIndicesInRange(const MeshData& data) {
  ASSERT_EQ(data.indices.size() % 3, 0u);
  for (auto index : data.indices) {
    ASSERT_LT(index, data.positions.size());
  }
  EXPECT_EQ(data.positions.size(), data.normals.size());
}

Scalar MinY(const MeshData& data) {
  Scalar result = data.positions[0].y;
  for (const auto& p : data.positions) {
    result = std::min(result, p.y);
  }
  return result;
}

Scalar MaxY(const MeshData& data) {
  Scalar result = data.positions[0].y;
  for (const auto& p : data.positions) {
    result = std::max(result, p.y);
  }
  return result;
}

Scalar MaxRadius(const MeshData& data) {
  Scalar result = 0.0f;
  for (const auto& p : data.positions) {
    result = std::max(result, std::sqrt(p.x * p.x + p.z * p.z));
  }
  return result;
}
}  // namespace

TEST(MemoryResourcePool, HandlesAreValidAndDistinct) {
  MemoryResourcePool pool;
  MeshHandle a = pool.AllocateMesh(MeshShape::Cylinder(0.01f, 1.0f));
  MeshHandle b = pool.AllocateMesh(MeshShape::Cone(1.0f, 1.0f));
  MaterialHandle m = pool.AllocateMaterial(Colors::RED);

  EXPECT_TRUE(a.IsValid());
  EXPECT_TRUE(b.IsValid());
  EXPECT_TRUE(m.IsValid());
  EXPECT_NE(a, b);
  EXPECT_FALSE(MeshHandle().IsValid());
  EXPECT_EQ(pool.NumMeshes(), 2u);
  EXPECT_EQ(pool.NumMaterials(), 1u);
  EXPECT_EQ(pool.GetMaterial(m)->base_color, Colors::RED);
}

TEST(MemoryResourcePool, ReleasedHandlesAreNotReused) {
  MemoryResourcePool pool;
  MeshHandle a = pool.AllocateMesh(MeshShape::Cuboid(1.0f, 1.0f, 1.0f));
  ASSERT_TRUE(pool.ReleaseMesh(a));
  EXPECT_FALSE(pool.ReleaseMesh(a));
  EXPECT_EQ(pool.GetMesh(a), nullptr);

  MeshHandle b = pool.AllocateMesh(MeshShape::Cuboid(1.0f, 1.0f, 1.0f));
  EXPECT_NE(a, b);
}

TEST(MemoryResourcePool, UnknownMaterialIsReported) {
  MemoryResourcePool pool;
  MaterialHandle m = pool.AllocateMaterial(Colors::WHITE);

  EXPECT_TRUE(pool.UpdateMaterialColor(m, Colors::YELLOW));
  EXPECT_EQ(pool.GetMaterial(m)->base_color, Colors::YELLOW);

  ASSERT_TRUE(pool.ReleaseMaterial(m));
  EXPECT_FALSE(pool.UpdateMaterialColor(m, Colors::BLUE));
  EXPECT_FALSE(pool.ReleaseMaterial(m));
  EXPECT_FALSE(pool.UpdateMaterialColor(MaterialHandle(), Colors::BLUE));
}

TEST(MemoryResourcePool, ClearDropsEverything) {
  MemoryResourcePool pool;
  pool.AllocateMesh(MeshShape::Cone(1.0f, 1.0f));
  pool.AllocateMaterial(Colors::GREEN);
  pool.Clear();

  EXPECT_EQ(pool.NumMeshes(), 0u);
  EXPECT_EQ(pool.NumMaterials(), 0u);
}

TEST(Primitives, CylinderIsCenteredOnOrigin) {
  MeshData data = Primitives::Build(MeshShape::Cylinder(0.01f, 1.0f, 32));
  ExpectIndicesInRange(data);

  // side quads plus two capped fans
  EXPECT_EQ(data.positions.size(), 2u * 32u + 2u * 33u);
  EXPECT_EQ(data.NumTriangles(), 4u * 32u);
  EXPECT_NEAR(MinY(data), -0.5f, 1e-6f);
  EXPECT_NEAR(MaxY(data), 0.5f, 1e-6f);
  EXPECT_NEAR(MaxRadius(data), 0.01f, 1e-6f);
}

TEST(Primitives, ConeApexPointsUp) {
  MeshData data = Primitives::Build(MeshShape::Cone(1.0f, 1.0f, 16));
  ExpectIndicesInRange(data);

  EXPECT_EQ(data.positions.size(), 2u * 16u + 17u);
  EXPECT_EQ(data.NumTriangles(), 2u * 16u);
  EXPECT_NEAR(MinY(data), -0.5f, 1e-6f);
  EXPECT_NEAR(MaxY(data), 0.5f, 1e-6f);
  EXPECT_NEAR(MaxRadius(data), 1.0f, 1e-5f);

  // every vertex at the top is on the axis
  for (const auto& p : data.positions) {
    if (p.y > 0.0f) {
      EXPECT_FLOAT_EQ(p.x, 0.0f);
      EXPECT_FLOAT_EQ(p.z, 0.0f);
    }
  }
}

TEST(Primitives, CuboidHasOutwardFaces) {
  MeshData data = Primitives::Build(MeshShape::Cuboid(2.0f, 4.0f, 6.0f));
  ExpectIndicesInRange(data);

  EXPECT_EQ(data.positions.size(), 24u);
  EXPECT_EQ(data.NumTriangles(), 12u);
  EXPECT_FLOAT_EQ(MinY(data), -2.0f);
  EXPECT_FLOAT_EQ(MaxY(data), 2.0f);

  for (size_t t = 0; t < data.NumTriangles(); t++) {
    const Vector3& a = data.positions[data.indices[3 * t]];
    const Vector3& b = data.positions[data.indices[3 * t + 1]];
    const Vector3& c = data.positions[data.indices[3 * t + 2]];
    Vector3 face_normal = glm::cross(b - a, c - a);
    EXPECT_GT(glm::dot(face_normal, data.normals[data.indices[3 * t]]), 0.0f);
  }
}

TEST(Primitives, SegmentsAreClampedToThree) {
  MeshData data = Primitives::BuildCylinder(1.0f, 1.0f, 1);
  EXPECT_EQ(data.NumTriangles(), 4u * 3u);
}

TEST(MeshRenderer, ReleasesHandlesOnDestroy) {
  MemoryResourcePool pool;
  GameInstance game(&pool);
  MeshHandle mesh = pool.AllocateMesh(MeshShape::Cone(1.0f, 1.0f));
  MaterialHandle material = pool.AllocateMaterial(Colors::WHITE);
  auto renderer = std::make_shared<MeshRenderer>(&pool, mesh, material);
  auto actor = game.CreateActor("Rendered");
  actor->AddComponent(renderer);

  EXPECT_TRUE(renderer->SetColor(Colors::RED));
  EXPECT_EQ(pool.GetMaterial(material)->base_color, Colors::RED);

  ASSERT_TRUE(game.DestroyActor(actor->GetId()));
  EXPECT_EQ(pool.NumMeshes(), 0u);
  EXPECT_EQ(pool.NumMaterials(), 0u);

  // a second destroy hook is harmless
  renderer->OnDestroy();
  EXPECT_FALSE(renderer->SetColor(Colors::GREEN));
}

TEST(MeshRenderer, SetColorOnForeignMaterialFails) {
  MemoryResourcePool pool;
  MeshRenderer renderer(&pool, MeshHandle{42}, MaterialHandle{42});
  EXPECT_FALSE(renderer.SetColor(Colors::BLUE));
}
