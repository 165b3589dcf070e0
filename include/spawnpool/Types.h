#pragma once

#include <cstdint>

// Handle to any object owned by a host. Never reused, so a handle to a
// destroyed object stays detectably stale.
using ObjectId = std::uint64_t;

constexpr ObjectId kNullObject = 0;

// Struct for ordered pairs with zero init
struct Vec2 {
	float x{};
	float y{};
};

inline bool operator==(const Vec2& a, const Vec2& b) {
	return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2& a, const Vec2& b) {
	return !(a == b);
}
