#pragma once

#include <string>
#include "Types.h"

// Capabilities the object pool needs from whatever owns the objects.
// The pool never touches objects except through this interface.
class ObjectHost {
public:
    virtual ~ObjectHost() = default;

    // Create an empty, active root object
    virtual ObjectId createObject(const std::string& name) = 0;

    // Deep-copy an object into a new root object. Returns kNullObject if
    // original is not alive.
    virtual ObjectId instantiate(ObjectId original) = 0;

    // Irreversibly remove an object and its children
    virtual void destroy(ObjectId obj) = 0;

    // False for kNullObject and for destroyed objects
    virtual bool isAlive(ObjectId obj) const = 0;

    virtual void setActive(ObjectId obj, bool active) = 0;
    virtual bool isActive(ObjectId obj) const = 0;

    // kNullObject parent places the object at the root
    virtual void setParent(ObjectId obj, ObjectId parent) = 0;

    virtual void setLocalTransform(ObjectId obj, const Vec2& position, float rotation, const Vec2& scale) = 0;
    virtual Vec2 getLocalScale(ObjectId obj) const = 0;

    // Diagnostic sink. context may be kNullObject.
    virtual void logWarning(ObjectId context, const std::string& message) = 0;
    virtual void logError(ObjectId context, const std::string& message) = 0;
};
