#pragma once
#include <string>
#include <unordered_map>

// Parameter names understood by the locomotion blend tree.
namespace AnimParam {
    inline const std::string Speed       = "Speed";       // normalized [0,1] blend
    inline const std::string Direction   = "Direction";   // forward/back input
    inline const std::string MotionSpeed = "MotionSpeed"; // input magnitude
    inline const std::string Grounded    = "Grounded";
    inline const std::string Jump        = "Jump";
    inline const std::string FreeFall    = "FreeFall";
}

// Receives named animation parameters. Optional: the controller is handed
// a null pointer when the character has no animator.
class AnimationSink {
public:
    virtual ~AnimationSink() = default;
    virtual void set_float(const std::string& name, float value) = 0;
    virtual void set_bool(const std::string& name, bool value)   = 0;
};

// Component-side sink that records the last value of every parameter.
// The debug overlay reads it; a skeletal animation layer would bind to it.
class AnimatorParameters : public AnimationSink {
public:
    void set_float(const std::string& name, float value) override { floats_[name] = value; }
    void set_bool(const std::string& name, bool value) override   { bools_[name] = value; }

    float get_float(const std::string& name, float fallback = 0.0f) const {
        auto it = floats_.find(name);
        return it == floats_.end() ? fallback : it->second;
    }

    bool get_bool(const std::string& name, bool fallback = false) const {
        auto it = bools_.find(name);
        return it == bools_.end() ? fallback : it->second;
    }

    bool has(const std::string& name) const {
        return floats_.count(name) != 0 || bools_.count(name) != 0;
    }

private:
    std::unordered_map<std::string, float> floats_;
    std::unordered_map<std::string, bool>  bools_;
};
