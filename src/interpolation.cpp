#include "pixshift/interpolation.hpp"
#include "pixshift/errors.hpp"
#include "pixshift/logger.hpp"

#include <string>

namespace ps {

namespace {

struct ModeName {
    InterpolationMode mode;
    const char* name;
    int legacy_code;
};

constexpr ModeName kModeNames[] = {
    {InterpolationMode::Nearest,  "nearest",  0},
    {InterpolationMode::Lanczos,  "lanczos",  1},
    {InterpolationMode::Bilinear, "bilinear", 2},
    {InterpolationMode::Bicubic,  "bicubic",  3},
    {InterpolationMode::Box,      "box",      4},
    {InterpolationMode::Hamming,  "hamming",  5},
};

} // namespace

const char* to_string(InterpolationMode mode) {
    for (const auto& e : kModeNames) {
        if (e.mode == mode) return e.name;
    }
    return "?";
}

InterpolationMode interpolation_from_string(const std::string& name) {
    for (const auto& e : kModeNames) {
        if (name == e.name) return e.mode;
    }
    throw ValidationError("interpolation must be one of: nearest, bilinear, bicubic, "
                          "box, hamming, lanczos (got \"" + name + "\")");
}

InterpolationMode interpolation_from_int(int code) {
    for (const auto& e : kModeNames) {
        if (e.legacy_code == code) {
            log::warn("Argument interpolation should be of type InterpolationMode instead of int. "
                      "Please, use InterpolationMode enum.");
            return e.mode;
        }
    }
    throw ValidationError("interpolation: unknown legacy code " + std::to_string(code));
}

bool resize_supports(Representation rep, InterpolationMode mode) {
    switch (rep) {
    case Representation::Object:
        return true;
    case Representation::Array:
        return mode == InterpolationMode::Nearest ||
               mode == InterpolationMode::Bilinear ||
               mode == InterpolationMode::Bicubic;
    case Representation::None:
    default:
        return false;
    }
}

bool affine_supports(InterpolationMode mode) {
    return mode == InterpolationMode::Nearest ||
           mode == InterpolationMode::Bilinear ||
           mode == InterpolationMode::Bicubic;
}

} // namespace ps
