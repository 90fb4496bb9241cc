#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <vecarrows/core/Global.hpp>
#include <vecarrows/runtime/engine/GameInstance.hpp>
#include <vecarrows/runtime/scene/Visibility.hpp>

using namespace VecArrows;

namespace {
class Probe : public Component {
 public:
  Probe(std::vector<std::string>* _log = nullptr) : log(_log) { SET_COMPONENT_NAME; }

  void Start() override { starts++; }

  void Update() override {
    updates++;
    if (log) {
      log->push_back("component");
    }
  }

  void OnDestroy() override { destroys++; }

  std::vector<std::string>* log;
  int starts = 0;
  int updates = 0;
  int destroys = 0;
};
}  // namespace

TEST(GameInstance, ActorIdsAreUniqueAndNeverReused) {
  GameInstance game;
  auto a = game.CreateActor("A");
  auto b = game.CreateActor("B");
  EXPECT_NE(a->GetId(), INVALID_ACTOR_ID);
  EXPECT_LT(a->GetId(), b->GetId());

  ActorId b_id = b->GetId();
  ASSERT_TRUE(game.DestroyActor(a->GetId()));
  auto c = game.CreateActor("C");
  EXPECT_GT(c->GetId(), b_id);
  EXPECT_EQ(game.FindActor(c->GetId()), c);
  EXPECT_EQ(game.FindActor("B"), b);
}

TEST(GameInstance, RegistersAsGlobalGame) {
  {
    GameInstance game;
    EXPECT_EQ(Global::game, &game);
  }
  EXPECT_EQ(Global::game, nullptr);
}

TEST(GameInstance, StagesRunInOrder) {
  GameInstance game;
  std::vector<std::string> log;
  game.on_attach_stage.Register([&log]() { log.push_back("attach"); });
  game.on_update_stage.Register([&log]() { log.push_back("update"); });
  game.on_detach_stage.Register([&log]() { log.push_back("detach"); });
  game.CreateActor("Actor")->AddComponent(std::make_shared<Probe>(&log));

  game.Step();

  std::vector<std::string> expected = {"attach", "component", "update", "detach"};
  EXPECT_EQ(log, expected);
  EXPECT_EQ(game.FrameCount(), 1u);
}

TEST(GameInstance, AddedIsVisibleForOneTick) {
  GameInstance game;
  std::vector<size_t> seen;
  game.on_attach_stage.Register([&]() { seen.push_back(game.Added<Visibility>().size()); });

  auto actor = game.CreateActor("Actor");
  actor->AddComponent(std::make_shared<Visibility>());
  EXPECT_TRUE(game.Added<Visibility>().empty());

  game.Step();
  game.Step();

  std::vector<size_t> expected = {1, 0};
  EXPECT_EQ(seen, expected);
}

TEST(GameInstance, ComponentsAttachedBeforeJoiningCountAsAdded) {
  GameInstance game;
  size_t added = 0;
  game.on_attach_stage.Register([&]() { added += game.Added<Probe>().size(); });

  auto actor = std::make_shared<Actor>("Prebuilt");
  actor->AddComponent(std::make_shared<Probe>());
  game.AddActor(actor);
  game.Step();

  EXPECT_EQ(added, 1u);
}

TEST(GameInstance, RemovedReportsActorOnNextTick) {
  GameInstance game;
  std::vector<ActorId> removed;
  game.on_detach_stage.Register([&]() {
    auto ids = game.Removed<Visibility>();
    removed.insert(removed.end(), ids.begin(), ids.end());
  });

  auto actor = game.CreateActor("Actor");
  actor->AddComponents({std::make_shared<Visibility>(), std::make_shared<Probe>()});
  game.Step();
  EXPECT_TRUE(removed.empty());

  ASSERT_TRUE(actor->RemoveComponent<Visibility>());
  EXPECT_FALSE(actor->RemoveComponent<Visibility>());
  game.Step();
  ASSERT_EQ(removed.size(), 1u);
  EXPECT_EQ(removed[0], actor->GetId());

  game.Step();
  EXPECT_EQ(removed.size(), 1u);
}

TEST(GameInstance, RemoveComponentSkipsOnDestroy) {
  GameInstance game;
  auto probe = std::make_shared<Probe>();
  auto actor = game.CreateActor("Actor");
  actor->AddComponent(probe);

  ASSERT_TRUE(actor->RemoveComponent(probe.get()));
  EXPECT_EQ(probe->actor, nullptr);
  EXPECT_EQ(probe->destroys, 0);
}

TEST(GameInstance, DestroyActorRunsOnDestroyWithoutRemoval) {
  GameInstance game;
  size_t removed = 0;
  game.on_detach_stage.Register([&]() { removed += game.Removed<Probe>().size(); });

  auto probe = std::make_shared<Probe>();
  auto actor = game.CreateActor("Actor");
  actor->AddComponent(probe);
  game.Step();

  ActorId id = actor->GetId();
  ASSERT_TRUE(game.DestroyActor(id));
  EXPECT_FALSE(game.IsAlive(id));
  EXPECT_FALSE(game.DestroyActor(id));
  EXPECT_EQ(actor->GetGame(), nullptr);
  EXPECT_EQ(probe->destroys, 1);

  game.Step();
  EXPECT_EQ(removed, 0u);
  EXPECT_EQ(probe->updates, 1);
}

TEST(GameInstance, StartRunsOnceBeforeUpdate) {
  GameInstance game;
  auto probe = std::make_shared<Probe>();
  game.CreateActor("Actor")->AddComponent(probe);

  game.Step();
  game.Step();
  game.Step();

  EXPECT_EQ(probe->starts, 1);
  EXPECT_EQ(probe->updates, 3);
}

TEST(GameInstance, DisabledComponentIsNotUpdated) {
  GameInstance game;
  auto probe = std::make_shared<Probe>();
  probe->enabled = false;
  game.CreateActor("Actor")->AddComponent(probe);

  game.Step();
  EXPECT_EQ(probe->updates, 0);
}

TEST(GameInstance, PropagatesParentTransforms) {
  GameInstance game;
  auto parent = game.CreateActor("Parent");
  auto child = game.CreateActor("Child");
  parent->Initialize(Vector3(1.0f, 0.0f, 0.0f), Vector3(2.0f));
  child->Initialize(Vector3(1.0f, 0.0f, 0.0f));
  ASSERT_TRUE(child->SetParent(parent));

  EXPECT_FALSE(child->transform->world().has_value());
  game.Step();

  ASSERT_TRUE(child->transform->world().has_value());
  const Pose& world = *child->transform->world();
  EXPECT_FLOAT_EQ(world.translation.x, 3.0f);
  EXPECT_FLOAT_EQ(world.scale.y, 2.0f);

  // rotation of the parent carries the child around
  parent->Rotate(Vector3(0.0f, 0.0f, 90.0f));
  game.Step();
  const Pose& rotated = *child->transform->world();
  EXPECT_NEAR(rotated.translation.x, 1.0f, 1e-5f);
  EXPECT_NEAR(rotated.translation.y, 2.0f, 1e-5f);
}

TEST(GameInstance, SetParentRejectsCycles) {
  GameInstance game;
  auto a = game.CreateActor("A");
  auto b = game.CreateActor("B");
  ASSERT_TRUE(b->SetParent(a));
  EXPECT_FALSE(a->SetParent(b));
  EXPECT_FALSE(a->SetParent(a));
  EXPECT_EQ(a->transform->GetParent(), nullptr);
  EXPECT_TRUE(b->SetParent(nullptr));
  EXPECT_EQ(b->transform->GetParent(), nullptr);
}

TEST(GameInstance, RunFinalizesScene) {
  GameInstance game;
  int finalized = 0;
  game.on_finalize.Register([&]() { finalized++; });
  auto probe = std::make_shared<Probe>();
  game.CreateActor("Actor")->AddComponent(probe);

  game.Run(4);

  EXPECT_EQ(game.FrameCount(), 4u);
  EXPECT_EQ(finalized, 1);
  EXPECT_EQ(probe->updates, 4);
  EXPECT_EQ(probe->destroys, 1);
  EXPECT_TRUE(game.GetActors().empty());
}
