#pragma once

#include <memory>
#include <map>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "Component.h"
#include "Types.h"

class Scene;

class GameObject {
public:
    explicit GameObject(std::string name = "GameObject") : name(std::move(name)) {}
    ~GameObject() = default;

    GameObject(const GameObject&) = delete;
    GameObject& operator=(const GameObject&) = delete;

    ObjectId getId() const { return id; }

    const std::string& getName() const { return name; }
    void setName(const std::string& n) { name = n; }

    // Active flag of this object alone. Components are notified only when
    // the flag actually changes.
    bool isActive() const { return active; }
    void setActive(bool value) {
        if (active == value) return;
        active = value;
        for (auto& [_, comp] : components) {
            if (active) {
                comp->onEnable(*this);
            } else {
                comp->onDisable(*this);
            }
        }
    }

    ObjectId getParent() const { return parent; }
    const std::vector<ObjectId>& getChildren() const { return children; }

    // Add a component of type T
    template <typename T>
    void addComponent(std::unique_ptr<T> comp) {
        std::type_index key(typeid(T));
        comp->onAdd(*this);  // Inform the component of its owner
        components[key] = std::move(comp);
    }

	// Remove a component of type T
	template <typename T>
	void removeComponent() {
		std::type_index key(typeid(T));
		auto it = components.find(key);
		if (it != components.end()) {
			components.erase(it);
		}
	}

	// Has component function
	template <typename T>
	bool hasComponent() const {
		std::type_index key(typeid(T));
		return components.find(key) != components.end();
	}

    // Get component of type T, or nullptr if not present
    template <typename T>
    T* getComponent() {
        std::type_index key(typeid(T));
        auto it = components.find(key);
        if (it != components.end()) {
            return dynamic_cast<T*>(it->second.get());
        }
        return nullptr;
    }

    template <typename T>
    const T* getComponent() const {
        std::type_index key(typeid(T));
        auto it = components.find(key);
        if (it != components.end()) {
            return dynamic_cast<const T*>(it->second.get());
        }
        return nullptr;
    }

    std::size_t getComponentCount() const { return components.size(); }

    // Replace this object's components with clones of other's
    void copyComponentsFrom(const GameObject& other) {
        components.clear();
        for (const auto& [key, comp] : other.components) {
            std::unique_ptr<Component> copy = comp->clone();
            copy->onAdd(*this);
            components[key] = std::move(copy);
        }
    }

    // Update all components
    void update(float deltaTime) {
        for (auto& [_, comp] : components) {
            comp->update(*this, deltaTime);
        }
    }

private:
    friend class Scene;

    ObjectId id = kNullObject;
    std::string name;
    bool active = true;
    ObjectId parent = kNullObject;
    std::vector<ObjectId> children;
    std::map<std::type_index, std::unique_ptr<Component>> components;
};
