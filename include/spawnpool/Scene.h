#pragma once

#include "GameObject.h"
#include "ObjectHost.h"
#include <SDL3/SDL.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Owns every GameObject of a running game and ticks the active ones.
// This is the ObjectHost an ObjectPool normally runs against.
class Scene : public ObjectHost {
public:
    struct Config {
        const char* name = "Scene";
        SDL_LogPriority logPriority = SDL_LOG_PRIORITY_WARN;
    };

    Scene();
    explicit Scene(const Config& cfg);
    ~Scene() override;

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // ObjectHost
    ObjectId createObject(const std::string& name) override;
    ObjectId instantiate(ObjectId original) override;
    void destroy(ObjectId obj) override;
    bool isAlive(ObjectId obj) const override;
    void setActive(ObjectId obj, bool active) override;
    bool isActive(ObjectId obj) const override;
    void setParent(ObjectId obj, ObjectId parent) override;
    void setLocalTransform(ObjectId obj, const Vec2& position, float rotation, const Vec2& scale) override;
    Vec2 getLocalScale(ObjectId obj) const override;
    void logWarning(ObjectId context, const std::string& message) override;
    void logError(ObjectId context, const std::string& message) override;

    // True when the object and all of its ancestors are active
    bool isActiveInHierarchy(ObjectId obj) const;

    // Ticks every object that is active in hierarchy, in creation order.
    // Objects destroyed during the tick are released when it ends.
    void update(float deltaTime);

    // nullptr if obj is not alive
    GameObject* get(ObjectId obj);
    const GameObject* get(ObjectId obj) const;

    template <typename T>
    T* getComponent(ObjectId obj) {
        GameObject* go = get(obj);
        return go ? go->getComponent<T>() : nullptr;
    }

    // First live object with this name, or kNullObject
    ObjectId find(const std::string& name) const;

    std::vector<ObjectId> getObjectsSnapshot() const;
    std::size_t getObjectCount() const { return objects.size(); }
    const std::string& getName() const { return name; }

private:
    ObjectId cloneObject(const GameObject& source, const std::string& cloneName);
    void collectSubtree(ObjectId root, std::vector<ObjectId>& out) const;
    void detachFromParent(GameObject& obj);
    std::string describe(ObjectId obj) const;

    std::string name;
    std::map<ObjectId, std::unique_ptr<GameObject>> objects;
    std::vector<std::unique_ptr<GameObject>> pendingRemovals;
    ObjectId nextId = 1;
    bool updating = false;
};
