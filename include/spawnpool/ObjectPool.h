#pragma once

#include "ObjectHost.h"
#include "Types.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

// Where and how a spawned instance is placed. Scale always comes from the
// template at spawn time.
struct SpawnParams {
    ObjectId parent = kNullObject;   // kNullObject or a destroyed object for a root object
    Vec2 position{};
    float rotation = 0.f;            // degrees
};

// Recycles instances of template objects instead of destroying and
// re-instantiating them.
//
// Each template gets a FIFO free list of inactive instances, parented under
// the pool's own holding object. Spawned instances are tracked back to their
// template so recycle() knows which free list they return to. Pools grow on
// demand and are never trimmed.
//
// getSpawned() and recycleAll() visit spawned instances oldest spawn first,
// so a recycleAll() refills the free lists in spawn order.
//
// The host must outlive the pool. Destroying the pool destroys its holding
// object and every free instance with it. Spawned instances stay with the
// host; any component that kept a pointer to the pool must not use it again.
//
// Not thread safe. Every call runs to completion on the caller's thread.
class ObjectPool {
public:
    enum class StartupPoolMode {
        Awake,          // created from awake()
        Start,          // created from start()
        CallManually    // only ensureStartupPoolsCreated() creates them
    };

    struct StartupPool {
        ObjectId prefab = kNullObject;
        std::size_t size = 0;
    };

    struct Config {
        StartupPoolMode startupPoolMode = StartupPoolMode::Awake;
        std::vector<StartupPool> startupPools;
    };

    explicit ObjectPool(ObjectHost& host);
    ObjectPool(ObjectHost& host, Config config);
    ~ObjectPool();

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    // Host lifecycle hooks. Each creates the startup pools when the
    // configured mode matches.
    void awake();
    void start();

    // Creates the configured startup pools the first time it is called
    void ensureStartupPoolsCreated();
    bool startupPoolsCreated() const { return startupCreated; }

    // Creates an empty pool for prefab and fills it with initialSize
    // inactive copies. Does nothing if the pool already exists.
    // Returns false, with SDL_GetError() set, if prefab is not alive.
    bool createPool(ObjectId prefab, std::size_t initialSize = 0);

    bool hasPool(ObjectId prefab) const;

    // Takes an instance from prefab's pool, or instantiates one if the pool
    // is empty, and makes it active. Spawning a prefab without a pool logs a
    // warning and creates a one-object pool first.
    // Returns kNullObject, with SDL_GetError() set, if prefab is not alive.
    ObjectId spawn(ObjectId prefab, const SpawnParams& params = {});

    // Deactivates a spawned instance and returns it to its prefab's pool.
    // Instances that were not spawned by this pool are logged as errors and
    // destroyed. The holding object itself is refused with an error.
    void recycle(ObjectId instance);

    // Recycle every spawned instance of prefab
    void recycleAll(ObjectId prefab);

    // Recycle every spawned instance
    void recycleAll();

    bool isSpawned(ObjectId instance) const;

    std::size_t countPooled(ObjectId prefab) const;
    std::size_t countSpawned(ObjectId prefab) const;
    std::size_t countAllPooled() const;

    std::vector<ObjectId> getPooled(ObjectId prefab) const;
    std::vector<ObjectId>& getPooled(ObjectId prefab, std::vector<ObjectId>& out, bool append = false) const;

    std::vector<ObjectId> getSpawned(ObjectId prefab) const;
    std::vector<ObjectId>& getSpawned(ObjectId prefab, std::vector<ObjectId>& out, bool append = false) const;

    // Parent of every pooled (free) instance
    ObjectId holdingArea() const { return holder; }

private:
    void placeSpawned(ObjectId instance, ObjectId prefab, const SpawnParams& params);
    void returnToPool(ObjectId instance, ObjectId prefab);
    // Spawned instances of prefab (all of them for kNullObject), oldest first
    void collectSpawned(ObjectId prefab, std::vector<ObjectId>& out) const;

    struct SpawnRecord {
        ObjectId prefab = kNullObject;
        std::uint64_t order = 0;
    };

    ObjectHost& host;
    Config config;
    ObjectId holder = kNullObject;
    bool startupCreated = false;

    std::unordered_map<ObjectId, std::deque<ObjectId>> pooledObjects;  // prefab -> free list
    std::unordered_map<ObjectId, SpawnRecord> spawnedObjects;          // instance -> prefab
    std::uint64_t spawnCounter = 0;
};
