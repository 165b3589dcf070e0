#include <spawnpool/ObjectPool.h>
#include <SDL3/SDL.h>
#include <algorithm>
#include <string>
#include <utility>

ObjectPool::ObjectPool(ObjectHost& host) : ObjectPool(host, Config{}) {}

ObjectPool::ObjectPool(ObjectHost& host, Config config)
    : host(host), config(std::move(config)) {
    holder = host.createObject("ObjectPool");
}

ObjectPool::~ObjectPool() {
    // Free instances are children of the holder and go with it
    if (host.isAlive(holder)) {
        host.destroy(holder);
    }
}

void ObjectPool::awake() {
    if (config.startupPoolMode == StartupPoolMode::Awake) {
        ensureStartupPoolsCreated();
    }
}

void ObjectPool::start() {
    if (config.startupPoolMode == StartupPoolMode::Start) {
        ensureStartupPoolsCreated();
    }
}

void ObjectPool::ensureStartupPoolsCreated() {
    if (startupCreated) return;
    startupCreated = true;

    for (const StartupPool& pool : config.startupPools) {
        if (!createPool(pool.prefab, pool.size)) {
            host.logWarning(kNullObject, std::string("Skipping startup pool: ") + SDL_GetError());
        }
    }
}

bool ObjectPool::createPool(ObjectId prefab, std::size_t initialSize) {
    if (!host.isAlive(prefab)) {
        SDL_SetError("Cannot create a pool for an invalid prefab (id %llu)",
                     static_cast<unsigned long long>(prefab));
        return false;
    }
    if (pooledObjects.find(prefab) != pooledObjects.end()) return true;

    std::deque<ObjectId>& list = pooledObjects[prefab];
    if (initialSize > 0) {
        // Copies inherit the prefab's active flag, so instantiate them
        // while the prefab is inactive
        bool active = host.isActive(prefab);
        host.setActive(prefab, false);
        while (list.size() < initialSize) {
            ObjectId obj = host.instantiate(prefab);
            host.setParent(obj, holder);
            list.push_back(obj);
        }
        host.setActive(prefab, active);
    }
    return true;
}

bool ObjectPool::hasPool(ObjectId prefab) const {
    return pooledObjects.find(prefab) != pooledObjects.end();
}

ObjectId ObjectPool::spawn(ObjectId prefab, const SpawnParams& params) {
    if (!host.isAlive(prefab)) {
        SDL_SetError("Cannot spawn an invalid prefab (id %llu)",
                     static_cast<unsigned long long>(prefab));
        return kNullObject;
    }

    auto it = pooledObjects.find(prefab);
    if (it == pooledObjects.end()) {
        host.logWarning(prefab, "Object was spawned, but wasn't pooled in the first place. "
                                "Creating a pool automatically as a safeguard, but you should probably fix this.");
        createPool(prefab, 1);
        it = pooledObjects.find(prefab);
    }

    // Oldest free instance first; handles destroyed behind our back are dropped
    std::deque<ObjectId>& list = it->second;
    ObjectId obj = kNullObject;
    while (obj == kNullObject && !list.empty()) {
        ObjectId candidate = list.front();
        list.pop_front();
        if (host.isAlive(candidate)) {
            obj = candidate;
        }
    }

    if (obj == kNullObject) {
        obj = host.instantiate(prefab);
        if (obj == kNullObject) {
            SDL_SetError("Failed to instantiate prefab (id %llu)",
                         static_cast<unsigned long long>(prefab));
            return kNullObject;
        }
    }

    placeSpawned(obj, prefab, params);
    return obj;
}

void ObjectPool::placeSpawned(ObjectId instance, ObjectId prefab, const SpawnParams& params) {
    // A parent that is gone means the root, never the holding area
    ObjectId parent = host.isAlive(params.parent) ? params.parent : kNullObject;
    host.setParent(instance, parent);
    host.setLocalTransform(instance, params.position, params.rotation, host.getLocalScale(prefab));
    host.setActive(instance, true);
    spawnedObjects[instance] = SpawnRecord{ prefab, ++spawnCounter };
}

void ObjectPool::recycle(ObjectId instance) {
    if (instance == kNullObject) return;
    if (instance == holder) {
        host.logError(instance, "The pool's holding object cannot be recycled");
        return;
    }

    auto it = spawnedObjects.find(instance);
    if (it == spawnedObjects.end()) {
        host.logError(instance, "Un-pooled object recycled. Might have been recycled earlier, "
                                "or maybe it was instantiated without spawn()");
        host.destroy(instance);
        return;
    }

    ObjectId prefab = it->second.prefab;
    spawnedObjects.erase(it);
    returnToPool(instance, prefab);
}

void ObjectPool::returnToPool(ObjectId instance, ObjectId prefab) {
    pooledObjects[prefab].push_back(instance);
    host.setParent(instance, holder);
    host.setActive(instance, false);
}

void ObjectPool::recycleAll(ObjectId prefab) {
    if (prefab == kNullObject) return;

    // recycle() erases from spawnedObjects, so collect first
    std::vector<ObjectId> targets;
    collectSpawned(prefab, targets);
    for (ObjectId instance : targets) {
        recycle(instance);
    }
}

void ObjectPool::recycleAll() {
    std::vector<ObjectId> targets;
    collectSpawned(kNullObject, targets);
    for (ObjectId instance : targets) {
        recycle(instance);
    }
}

void ObjectPool::collectSpawned(ObjectId prefab, std::vector<ObjectId>& out) const {
    std::vector<std::pair<std::uint64_t, ObjectId>> found;
    for (const auto& [instance, record] : spawnedObjects) {
        if (prefab == kNullObject || record.prefab == prefab) {
            found.emplace_back(record.order, instance);
        }
    }
    std::sort(found.begin(), found.end());

    out.reserve(out.size() + found.size());
    for (const auto& [_, instance] : found) {
        out.push_back(instance);
    }
}

bool ObjectPool::isSpawned(ObjectId instance) const {
    return spawnedObjects.find(instance) != spawnedObjects.end();
}

std::size_t ObjectPool::countPooled(ObjectId prefab) const {
    auto it = pooledObjects.find(prefab);
    return it != pooledObjects.end() ? it->second.size() : 0;
}

std::size_t ObjectPool::countSpawned(ObjectId prefab) const {
    std::size_t count = 0;
    for (const auto& [_, record] : spawnedObjects) {
        if (record.prefab == prefab) {
            ++count;
        }
    }
    return count;
}

std::size_t ObjectPool::countAllPooled() const {
    std::size_t count = 0;
    for (const auto& [_, list] : pooledObjects) {
        count += list.size();
    }
    return count;
}

std::vector<ObjectId> ObjectPool::getPooled(ObjectId prefab) const {
    std::vector<ObjectId> list;
    getPooled(prefab, list);
    return list;
}

std::vector<ObjectId>& ObjectPool::getPooled(ObjectId prefab, std::vector<ObjectId>& out, bool append) const {
    if (!append) {
        out.clear();
    }

    auto it = pooledObjects.find(prefab);
    if (it != pooledObjects.end()) {
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    return out;
}

std::vector<ObjectId> ObjectPool::getSpawned(ObjectId prefab) const {
    std::vector<ObjectId> list;
    getSpawned(prefab, list);
    return list;
}

std::vector<ObjectId>& ObjectPool::getSpawned(ObjectId prefab, std::vector<ObjectId>& out, bool append) const {
    if (!append) {
        out.clear();
    }

    if (prefab != kNullObject) {
        collectSpawned(prefab, out);
    }
    return out;
}
