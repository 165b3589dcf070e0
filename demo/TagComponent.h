#pragma once
#include <spawnpool/Component.h>
#include <memory>
#include <string>

class TagComponent : public Component {
public:
    explicit TagComponent(const std::string& t) : tag(t) {}

    const std::string& getTag() const { return tag; }

    bool hasTag(const std::string& t) const {
        return tag == t;
    }

    std::unique_ptr<Component> clone() const override {
        return std::make_unique<TagComponent>(tag);
    }

private:
    std::string tag;
};
