#include <SDL3/SDL.h>
#include <cstdlib>
#include <memory>

#include <spawnpool/GameObject.h>
#include <spawnpool/ObjectPool.h>
#include <spawnpool/Scene.h>
#include <spawnpool/TransformComponent.h>

#include "EmitterComponent.h"
#include "ProjectileComponent.h"
#include "TagComponent.h"

namespace {

const float FIXED_DT = 1.0f / 60.0f;
const int DEFAULT_FRAMES = 600;
const int STATS_EVERY = 120;

void logPoolStats(const ObjectPool& pool, ObjectId prefab, int frame) {
	SDL_Log("[frame %d] pooled: %zu  spawned: %zu  all pooled: %zu",
		frame, pool.countPooled(prefab), pool.countSpawned(prefab), pool.countAllPooled());
}

}

int main(int argc, char* argv[]) {
	int frames = DEFAULT_FRAMES;
	if (argc > 1) {
		frames = std::atoi(argv[1]);
		if (frames <= 0) {
			SDL_Log("Usage: %s [frames]", argv[0]);
			return 1;
		}
	}

	Scene::Config config;
	config.name = "Demo";
	config.logPriority = SDL_LOG_PRIORITY_INFO;
	Scene scene(config);

	// Prefab stays inactive so the scene never ticks it
	ObjectId bulletPrefab = scene.createObject("Bullet");
	scene.setActive(bulletPrefab, false);

	ObjectPool::Config poolConfig;
	poolConfig.startupPoolMode = ObjectPool::StartupPoolMode::Awake;
	poolConfig.startupPools.push_back({ bulletPrefab, 16 });
	ObjectPool pool(scene, poolConfig);

	GameObject* bullet = scene.get(bulletPrefab);
	bullet->addComponent(std::make_unique<TagComponent>("projectile"));
	bullet->addComponent(std::make_unique<TransformComponent>(0.f, 0.f, 0.f, 0.5f, 0.5f));
	bullet->addComponent(std::make_unique<ProjectileComponent>(pool, 1.5f, 10));

	pool.awake();

	SDL_Log("GameObject Pool initialized:");
	SDL_Log("  - Prefab: %s", bullet->getName().c_str());
	SDL_Log("  - Startup size: %zu objects", pool.countPooled(bulletPrefab));

	ObjectId emitterId = scene.createObject("Emitter");
	GameObject* emitter = scene.get(emitterId);
	emitter->addComponent(std::make_unique<TagComponent>("emitter"));
	emitter->addComponent(std::make_unique<TransformComponent>(960.f, 540.f));
	emitter->addComponent(std::make_unique<EmitterComponent>(scene, pool, bulletPrefab, 0.05f));

	pool.start();

	for (int frame = 1; frame <= frames; ++frame) {
		scene.update(FIXED_DT);

		if (frame % STATS_EVERY == 0) {
			logPoolStats(pool, bulletPrefab, frame);
		}
	}

	auto* shooter = scene.getComponent<EmitterComponent>(emitterId);
	SDL_Log("Shots fired: %d", shooter ? shooter->getShotsFired() : 0);
	SDL_Log("Bullet instances ever created: %zu",
		pool.countPooled(bulletPrefab) + pool.countSpawned(bulletPrefab));

	pool.recycleAll();
	logPoolStats(pool, bulletPrefab, frames);

	return 0;
}
