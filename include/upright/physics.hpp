#pragma once

#include <Eigen/Dense>
#include <string>
#include <unordered_map>
#include <vector>

namespace upright {

// Abstract rigid-body interface the controller reads from and writes to.
// Implementations wrap a physics engine's body (DART BodyNode, a test fake, ...).
class BodyHandle {
public:
    virtual ~BodyHandle() = default;

    // False while the engine has not created the body yet, or after disposal.
    // Readers skip the tick instead of calling the accessors below.
    virtual bool isLive() const = 0;

    // World-frame kinematics (y is up)
    virtual Eigen::Vector3d translation() const = 0;
    virtual Eigen::Vector3d linvel() const = 0;
    virtual Eigen::Vector3d angvel() const = 0;
    virtual Eigen::Quaterniond rotation() const = 0;

    // World-frame actuation. Throws on engine failure (disposed body etc.)
    virtual void addTorque(const Eigen::Vector3d& torque, bool wake = true) = 0;
    virtual void addForce(const Eigen::Vector3d& force, bool wake = true) = 0;
};

// Name -> body lookup for one robot instance. Non-owning: the physics side
// owns the bodies and must outlive the rig.
class BodyRig {
public:
    void attach(const std::string& part, BodyHandle* body);
    void detach(const std::string& part);
    void clear() { bodies_.clear(); }

    // nullptr when the part is not attached
    BodyHandle* find(const std::string& part) const;

    // nullptr when the part is not attached or not live
    BodyHandle* live(const std::string& part) const;

    std::vector<std::string> parts() const;
    size_t size() const { return bodies_.size(); }

private:
    std::unordered_map<std::string, BodyHandle*> bodies_;
};

} // namespace upright
