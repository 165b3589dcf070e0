#pragma once
#include <spawnpool/Component.h>
#include <spawnpool/GameObject.h>
#include <spawnpool/ObjectPool.h>
#include <memory>

class ProjectileComponent : public Component {
public:
	float lifetime;
	float maxLifetime;
	int damage;
	bool hasHit = false;

	ProjectileComponent(ObjectPool& pool, float life = 2.0f, int dmg = 10)
		: lifetime(life), maxLifetime(life), damage(dmg), pool(&pool) {}

	// Pooled projectiles come back here instead of being constructed again
	void onEnable(GameObject& obj) override {
		lifetime = maxLifetime;
		hasHit = false;
	}

	void update(GameObject& obj, float dt) override {
		lifetime -= dt;

		// Return projectile to the pool when lifetime ends
		if (lifetime <= 0 || hasHit) {
			pool->recycle(obj.getId());
		}
	}

	void onHit() {
		hasHit = true;
	}

	int getDamage() const {
		return damage;
	}

	std::unique_ptr<Component> clone() const override {
		return std::make_unique<ProjectileComponent>(*pool, maxLifetime, damage);
	}

private:
	ObjectPool* pool;
};
