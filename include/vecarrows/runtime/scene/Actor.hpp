#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <vecarrows/runtime/scene/Component.hpp>
#include <vecarrows/runtime/scene/Transform.hpp>

namespace VecArrows {
class GameInstance;

using ActorId = uint64_t;
constexpr ActorId INVALID_ACTOR_ID = 0;

class Actor {
 public:
  Actor();

  Actor(std::string name);

  Actor(const Actor&) = delete;
  Actor& operator=(const Actor&) = delete;

  // rotation in euler degrees
  void Initialize(Vector3 position, Vector3 scale = Vector3(1), Vector3 rotation = Vector3(0));

  void Rotate(Vector3 rotation);

  // Parents this actor's transform to another actor's. Passing nullptr detaches.
  // Fails when the new parent would create a cycle.
  bool SetParent(const std::shared_ptr<Actor>& parent);

  void Start();

  void Update();

  void OnDestroy();

  void AddComponent(std::shared_ptr<Component> component);

  void AddComponents(const std::initializer_list<std::shared_ptr<Component>>& new_components);

  // Detaches the component without calling OnDestroy, the owning game
  // reports the removal on the next tick.
  bool RemoveComponent(Component* component);

  template <typename T>
  std::enable_if_t<std::is_base_of<Component, T>::value, bool> RemoveComponent() {
    T* component = GetComponent<T>();
    if (component == nullptr) {
      return false;
    }
    return RemoveComponent(component);
  }

  template <typename T>
  std::enable_if_t<std::is_base_of<Component, T>::value, T*> GetComponent() {
    T* result = nullptr;
    for (auto c : components) {
      result = dynamic_cast<T*>(c.get());
      if (result)
        return result;
    }
    return result;
  }

  template <typename T>
  std::enable_if_t<std::is_base_of<Component, T>::value, std::vector<T*>> GetComponents() {
    std::vector<T*> result;
    for (auto c : components) {
      auto item = dynamic_cast<T*>(c.get());
      if (item) {
        result.push_back(item);
      }
    }
    return result;
  }

  const std::string GetName();

  ActorId GetId() const;

  GameInstance* GetGame() const;

 public:
  std::shared_ptr<Transform> transform = std::make_shared<Transform>();
  std::vector<std::shared_ptr<Component>> components;
  std::string name;

 private:
  friend class GameInstance;

  ActorId id_ = INVALID_ACTOR_ID;
  GameInstance* game_ = nullptr;
};
}  // namespace VecArrows
