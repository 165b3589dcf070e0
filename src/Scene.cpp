#include <spawnpool/Scene.h>
#include <spawnpool/Log.h>
#include <spawnpool/TransformComponent.h>
#include <algorithm>

Scene::Scene() : Scene(Config{}) {}

Scene::Scene(const Config& cfg) : name(cfg.name ? cfg.name : "Scene") {
    SDL_SetLogPriority(SPAWNPOOL_LOG_CATEGORY, cfg.logPriority);
}

Scene::~Scene() = default;

ObjectId Scene::createObject(const std::string& objName) {
    auto obj = std::make_unique<GameObject>(objName);
    obj->id = nextId++;
    ObjectId id = obj->id;
    objects[id] = std::move(obj);
    return id;
}

ObjectId Scene::instantiate(ObjectId original) {
    const GameObject* source = get(original);
    if (!source) return kNullObject;
    return cloneObject(*source, source->getName() + " (Clone)");
}

// Copies source and its whole subtree. The copy keeps source's active flag
// and is left at the root.
ObjectId Scene::cloneObject(const GameObject& source, const std::string& cloneName) {
    ObjectId id = createObject(cloneName);
    GameObject& copy = *objects[id];
    copy.active = source.active;
    copy.copyComponentsFrom(source);

    for (ObjectId childId : source.children) {
        const GameObject* child = get(childId);
        if (!child) continue;
        ObjectId childCopy = cloneObject(*child, child->getName());
        objects[childCopy]->parent = id;
        copy.children.push_back(childCopy);
    }
    return id;
}

void Scene::destroy(ObjectId obj) {
    GameObject* go = get(obj);
    if (!go) return;

    detachFromParent(*go);

    std::vector<ObjectId> subtree;
    collectSubtree(obj, subtree);
    for (ObjectId id : subtree) {
        auto it = objects.find(id);
        if (it == objects.end()) continue;

        // Components may still be running this frame
        if (updating) {
            pendingRemovals.push_back(std::move(it->second));
        }
        objects.erase(it);
    }
}

void Scene::collectSubtree(ObjectId root, std::vector<ObjectId>& out) const {
    const GameObject* go = get(root);
    if (!go) return;
    out.push_back(root);
    for (ObjectId child : go->children) {
        collectSubtree(child, out);
    }
}

void Scene::detachFromParent(GameObject& obj) {
    if (GameObject* parent = get(obj.parent)) {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), obj.id), siblings.end());
    }
    obj.parent = kNullObject;
}

bool Scene::isAlive(ObjectId obj) const {
    return objects.find(obj) != objects.end();
}

void Scene::setActive(ObjectId obj, bool active) {
    if (GameObject* go = get(obj)) {
        go->setActive(active);
    }
}

bool Scene::isActive(ObjectId obj) const {
    const GameObject* go = get(obj);
    return go && go->isActive();
}

bool Scene::isActiveInHierarchy(ObjectId obj) const {
    const GameObject* go = get(obj);
    while (go) {
        if (!go->isActive()) return false;
        go = get(go->parent);
    }
    return obj != kNullObject && isAlive(obj);
}

void Scene::setParent(ObjectId obj, ObjectId parent) {
    GameObject* go = get(obj);
    if (!go) return;

    if (parent != kNullObject) {
        if (!isAlive(parent)) {
            logWarning(obj, "Cannot parent to a destroyed object");
            return;
        }
        // Walk up from the new parent; finding obj means a cycle
        for (ObjectId up = parent; up != kNullObject; up = get(up)->parent) {
            if (up == obj) {
                logWarning(obj, "Cannot parent an object under itself or its descendants");
                return;
            }
        }
    }

    if (go->parent == parent) return;

    detachFromParent(*go);
    go->parent = parent;
    if (GameObject* newParent = get(parent)) {
        newParent->children.push_back(obj);
    }
}

void Scene::setLocalTransform(ObjectId obj, const Vec2& position, float rotation, const Vec2& scale) {
    GameObject* go = get(obj);
    if (!go) return;

    auto* transform = go->getComponent<TransformComponent>();
    if (!transform) {
        go->addComponent(std::make_unique<TransformComponent>());
        transform = go->getComponent<TransformComponent>();
    }
    transform->setLocalPosition(position);
    transform->setLocalRotation(rotation);
    transform->setLocalScale(scale);
}

Vec2 Scene::getLocalScale(ObjectId obj) const {
    const GameObject* go = get(obj);
    if (go) {
        if (const auto* transform = go->getComponent<TransformComponent>()) {
            return transform->getLocalScale();
        }
    }
    return { 1.f, 1.f };
}

std::string Scene::describe(ObjectId obj) const {
    const GameObject* go = get(obj);
    std::string label = go ? go->getName() : "<destroyed>";
    return label + "#" + std::to_string(obj);
}

void Scene::logWarning(ObjectId context, const std::string& message) {
    if (context == kNullObject) {
        SDL_LogWarn(SPAWNPOOL_LOG_CATEGORY, "%s", message.c_str());
        return;
    }
    SDL_LogWarn(SPAWNPOOL_LOG_CATEGORY, "%s (%s)", message.c_str(), describe(context).c_str());
}

void Scene::logError(ObjectId context, const std::string& message) {
    if (context == kNullObject) {
        SDL_LogError(SPAWNPOOL_LOG_CATEGORY, "%s", message.c_str());
        return;
    }
    SDL_LogError(SPAWNPOOL_LOG_CATEGORY, "%s (%s)", message.c_str(), describe(context).c_str());
}

void Scene::update(float deltaTime) {
    updating = true;

    std::vector<ObjectId> snapshot = getObjectsSnapshot();
    for (ObjectId id : snapshot) {
        // Skip objects destroyed or deactivated earlier in this tick
        GameObject* obj = get(id);
        if (!obj || !isActiveInHierarchy(id)) continue;

        obj->update(deltaTime);
    }

    updating = false;

    // FLUSH REMOVALS AFTER THE TICK
    pendingRemovals.clear();
}

GameObject* Scene::get(ObjectId obj) {
    auto it = objects.find(obj);
    return it != objects.end() ? it->second.get() : nullptr;
}

const GameObject* Scene::get(ObjectId obj) const {
    auto it = objects.find(obj);
    return it != objects.end() ? it->second.get() : nullptr;
}

ObjectId Scene::find(const std::string& objName) const {
    for (const auto& [id, obj] : objects) {
        if (obj->getName() == objName) return id;
    }
    return kNullObject;
}

std::vector<ObjectId> Scene::getObjectsSnapshot() const {
    std::vector<ObjectId> ids;
    ids.reserve(objects.size());
    for (const auto& [id, _] : objects) {
        ids.push_back(id);
    }
    return ids;
}
