#pragma once
#include <SDL3/SDL.h>
#include <spawnpool/Component.h>
#include <spawnpool/GameObject.h>
#include <spawnpool/ObjectPool.h>
#include <spawnpool/Scene.h>
#include <spawnpool/TransformComponent.h>
#include <cmath>
#include <memory>

// Fires a projectile from the pool every fireInterval seconds, sweeping the
// firing angle a little each shot.
class EmitterComponent : public Component {
public:
	EmitterComponent(Scene& scene, ObjectPool& pool, ObjectId projectilePrefab,
		float fireInterval = 0.1f, float speed = 400.0f, float sweepDegrees = 15.0f)
		: scene(&scene), pool(&pool), prefab(projectilePrefab),
		fireInterval(fireInterval), speed(speed), sweepDegrees(sweepDegrees) {}

	void update(GameObject& obj, float dt) override {
		if (fireInterval <= 0.0f) return;

		cooldown -= dt;
		while (cooldown <= 0.0f) {
			fire(obj);
			cooldown += fireInterval;
		}
	}

	int getShotsFired() const { return shotsFired; }

	std::unique_ptr<Component> clone() const override {
		return std::make_unique<EmitterComponent>(*scene, *pool, prefab, fireInterval, speed, sweepDegrees);
	}

private:
	void fire(GameObject& obj) {
		Vec2 origin{};
		if (auto* transform = obj.getComponent<TransformComponent>()) {
			origin = transform->getLocalPosition();
		}

		SpawnParams params;
		params.position = origin;
		params.rotation = angle;

		ObjectId projectile = pool->spawn(prefab, params);
		if (projectile == kNullObject) {
			SDL_Log("ERROR: Failed to spawn projectile: %s", SDL_GetError());
			return;
		}

		float radians = angle * 3.14159f / 180.0f;
		if (auto* transform = scene->getComponent<TransformComponent>(projectile)) {
			transform->setVelocity(std::cos(radians) * speed, std::sin(radians) * speed);
		}

		angle = std::fmod(angle + sweepDegrees, 360.0f);
		++shotsFired;
	}

	Scene* scene;
	ObjectPool* pool;
	ObjectId prefab;
	float fireInterval;
	float speed;
	float sweepDegrees;
	float cooldown = 0.0f;
	float angle = 0.0f;
	int shotsFired = 0;
};
