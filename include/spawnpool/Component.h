#pragma once
#include <memory>

class GameObject; // Forward declaration

class Component {
public:
    virtual ~Component() = default;

    // Called every frame while the owner is active in the hierarchy
    virtual void update(GameObject& obj, float deltaTime) {}

    // Called when the owner goes from inactive to active. Pooled objects
    // reset their per-use state here, since they are never re-added.
    virtual void onEnable(GameObject& obj) {}

    // Called when the owner goes from active to inactive
    virtual void onDisable(GameObject& obj) {}

    // Optional init hook when added to an object
    virtual void onAdd(GameObject& obj) { this->owner = &obj; }

    // Copy used when a GameObject is instantiated from a template.
    // The copy is not attached to any owner yet.
    virtual std::unique_ptr<Component> clone() const = 0;

protected:
    GameObject* owner = nullptr;
};
