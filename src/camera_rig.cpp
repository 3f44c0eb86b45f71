#include "camera_rig.hpp"
#include "physics_handles.hpp"
#include <raymath.h>

RaylibCameraRig::RaylibCameraRig(CameraTargetSlot slot, float fovy) : slot_(slot) {
    camera_.position   = {0.0f, 1.6f, -4.0f};
    camera_.target     = {0.0f, 1.6f, 0.0f};
    camera_.up         = {0.0f, 1.0f, 0.0f};
    camera_.fovy       = fovy;
    camera_.projection = CAMERA_PERSPECTIVE;
}

ecs::Vec3 RaylibCameraRig::view_forward() const {
    return MathBridge::FromRaylib(Vector3Normalize(Vector3Subtract(camera_.target, camera_.position)));
}

void RaylibCameraRig::place(const Vector3& position, const Vector3& target) {
    camera_.position = position;
    camera_.target   = target;
}
