#pragma once
#include "collaborators.hpp"
#include "systems/camera_filters.hpp"
#include <raylib.h>

// One Raylib camera behind the CameraRig seam. CameraSystem places it each
// frame; the controller only switches it and reads its forward.
class RaylibCameraRig final : public CameraRig {
public:
    RaylibCameraRig(CameraTargetSlot slot, float fovy);

    void             set_active(bool active) override { active_ = active; }
    bool             active() const override { return active_; }
    void             set_follow_and_look_target(CameraTargetSlot slot) override { slot_ = slot; }
    CameraTargetSlot follow_target() const override { return slot_; }
    ecs::Vec3        view_forward() const override;

    void place(const Vector3& position, const Vector3& target);

    const Camera3D& camera() const { return camera_; }

private:
    Camera3D         camera_{};
    CameraTargetSlot slot_;
    bool             active_ = false;
};

// World resource: both rigs plus the state of their smoothing filters.
struct CameraRigs {
    RaylibCameraRig first_person{CameraTargetSlot::FirstPersonHead, 70.0f};
    RaylibCameraRig third_person{CameraTargetSlot::ThirdPersonPivot, 45.0f};
    ZoomState       zoom;
    HeadFollowState head;

    const RaylibCameraRig& active() const {
        return third_person.active() ? third_person : first_person;
    }
};
