#include "upright/physics.hpp"
#include "upright/error.hpp"
#include <algorithm>

namespace upright {

void BodyRig::attach(const std::string& part, BodyHandle* body) {
    if (body == nullptr) {
        throw UprightError(ErrorCode::InvalidArgument, part, "Cannot attach a null body");
    }
    bodies_[part] = body;
}

void BodyRig::detach(const std::string& part) {
    bodies_.erase(part);
}

BodyHandle* BodyRig::find(const std::string& part) const {
    auto it = bodies_.find(part);
    if (it == bodies_.end()) return nullptr;
    return it->second;
}

BodyHandle* BodyRig::live(const std::string& part) const {
    BodyHandle* body = find(part);
    if (body == nullptr || !body->isLive()) return nullptr;
    return body;
}

std::vector<std::string> BodyRig::parts() const {
    std::vector<std::string> names;
    names.reserve(bodies_.size());
    for (const auto& [name, body] : bodies_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace upright
