#pragma once
#include "Component.h"
#include "Types.h"

// Local transform relative to the parent object (or the scene root).
class TransformComponent : public Component {
public:
    TransformComponent(float x = 0.f, float y = 0.f, float rotation = 0.f, float sx = 1.f, float sy = 1.f)
        : position({ x, y }), rotation(rotation), scale({ sx, sy }) {
    }

    // Position accessors
    Vec2 getLocalPosition() const { return position; }
    void setLocalPosition(const Vec2& p) { position = p; }

    // Rotation in degrees, 0 is identity
    float getLocalRotation() const { return rotation; }
    void setLocalRotation(float degrees) { rotation = degrees; }

    // Scale accessors
    Vec2 getLocalScale() const { return scale; }
    void setLocalScale(const Vec2& s) { scale = s; }

    // Velocity accessors
    Vec2 getVelocity() const { return velocity; }
    void setVelocity(float vx, float vy) { velocity = { vx, vy }; }

    // Move by velocity * deltaTime
    void update(GameObject& obj, float deltaTime) override {
        position.x += velocity.x * deltaTime;
        position.y += velocity.y * deltaTime;
    }

    // Helper to zero out velocity for static objects
    void stop() { velocity = { 0.f, 0.f }; }

    std::unique_ptr<Component> clone() const override {
        return std::make_unique<TransformComponent>(*this);
    }

private:
    Vec2 position;       // local position
    float rotation;      // local rotation, degrees
    Vec2 scale;          // local scale
    Vec2 velocity{};     // movement velocity
};
