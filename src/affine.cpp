#include "pixshift/affine.hpp"
#include "pixshift/errors.hpp"

#include <cmath>

namespace ps {

static double radians(double deg) {
    const double pi = std::acos(-1.0);
    return deg * pi / 180.0;
}

// RSS(a, s, (sx, sy)) = R(a) * S(s) * SHy(sy) * SHx(sx)
//   = [ s*cos(a - sy)/cos(sy), s*(-cos(a - sy)*tan(sx)/cos(sy) - sin(a)) ]
//     [ s*sin(a - sy)/cos(sy), s*(-sin(a - sy)*tan(sx)/cos(sy) + cos(a)) ]
// det(R) = det(SH) = 1，所以 RSS^-1（不含 scale）直接由 [d, -b; -c, a] 得到
AffineMatrix inverse_affine_matrix(const std::array<double, 2>& center,
                                   double angle,
                                   const std::array<double, 2>& translate,
                                   double scale,
                                   const std::array<double, 2>& shear) {
    if (!(scale > 0.0) || !std::isfinite(scale))
        throw ValidationError("inverse_affine_matrix: scale must be positive");

    const double rot = radians(angle);
    const double sx  = radians(shear[0]);
    const double sy  = radians(shear[1]);

    const double cx = center[0];
    const double cy = center[1];
    const double tx = translate[0];
    const double ty = translate[1];

    // 不含 scale 的 RSS
    const double a = std::cos(rot - sy) / std::cos(sy);
    const double b = -std::cos(rot - sy) * std::tan(sx) / std::cos(sy) - std::sin(rot);
    const double c = std::sin(rot - sy) / std::cos(sy);
    const double d = -std::sin(rot - sy) * std::tan(sx) / std::cos(sy) + std::cos(rot);

    AffineMatrix m = {d, -b, 0.0, -c, a, 0.0};
    for (double& v : m) v /= scale;

    // RSS^-1 * C^-1 * T^-1
    m[2] += m[0] * (-cx - tx) + m[1] * (-cy - ty);
    m[5] += m[3] * (-cx - tx) + m[4] * (-cy - ty);

    // C * RSS^-1 * C^-1 * T^-1
    m[2] += cx;
    m[5] += cy;

    return m;
}

} // namespace ps
