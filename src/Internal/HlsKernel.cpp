/**
 * @file HlsKernel.cpp
 * @brief RGB <-> HLS kernels (hue in radians)
 */

#include <PixAug/Internal/HlsKernel.h>
#include <PixAug/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Pix::Aug::Internal {

namespace {

// Remainder with the sign of the divisor
template<typename T>
inline T FloorMod(T a, T m) {
    return a - m * std::floor(a / m);
}

template<typename T>
inline T ZeroIfNan(T v) {
    return std::isnan(v) ? T(0) : v;
}

template<typename T>
inline T HlsChannel(T k, T l, T a) {
    const T bounded = std::max(std::min(std::min(k - T(3), T(9) - k), T(1)), T(-1));
    return l - a * bounded;
}

} // anonymous namespace

template<typename T>
void RgbToHlsRadians(const T* r, const T* g, const T* b,
                     T* h, T* l, T* s, size_t n) {
    const T twoPi = static_cast<T>(TWO_PI);
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(n);

    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        const T rv = r[i];
        const T gv = g[i];
        const T bv = b[i];

        // First maximum wins on ties (red, then green, then blue)
        int imax = 0;
        T maxc = rv;
        if (gv > maxc) { maxc = gv; imax = 1; }
        if (bv > maxc) { maxc = bv; imax = 2; }
        const T minc = std::min({rv, gv, bv});

        const T sum = maxc + minc;
        const T lv = sum / T(2);
        const T delta = maxc - minc;

        if (delta == T(0)) {
            h[i] = T(0);
            l[i] = ZeroIfNan(lv);
            s[i] = T(0);
            continue;
        }

        const T sv = (lv < T(0.5)) ? delta / sum : delta / (T(2) - sum);

        T hi;
        if (imax == 0) {
            hi = FloorMod((gv - bv) / delta, T(6));
        } else if (imax == 1) {
            hi = (bv - rv) / delta + T(2);
        } else {
            hi = (rv - gv) / delta + T(4);
        }

        h[i] = ZeroIfNan(twoPi * (T(60) * hi) / T(360));
        l[i] = ZeroIfNan(lv);
        s[i] = ZeroIfNan(sv);
    }
}

template<typename T>
void HlsRadiansToRgb(const T* h, const T* l, const T* s,
                     T* r, T* g, T* b, size_t n) {
    const T twoPi = static_cast<T>(TWO_PI);
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(n);

    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        const T hueDeg = h[i] * T(360) / twoPi;
        const T lv = l[i];
        const T sv = s[i];

        const T sector = hueDeg / T(30);
        const T kr = FloorMod(T(0) + sector, T(12));
        const T kg = FloorMod(T(8) + sector, T(12));
        const T kb = FloorMod(T(4) + sector, T(12));

        const T a = sv * std::min(lv, T(1) - lv);

        r[i] = HlsChannel(kr, lv, a);
        g[i] = HlsChannel(kg, lv, a);
        b[i] = HlsChannel(kb, lv, a);
    }
}

template PIXAUG_API void RgbToHlsRadians<float>(
    const float*, const float*, const float*, float*, float*, float*, size_t);
template PIXAUG_API void RgbToHlsRadians<double>(
    const double*, const double*, const double*, double*, double*, double*, size_t);
template PIXAUG_API void HlsRadiansToRgb<float>(
    const float*, const float*, const float*, float*, float*, float*, size_t);
template PIXAUG_API void HlsRadiansToRgb<double>(
    const double*, const double*, const double*, double*, double*, double*, size_t);

} // namespace Pix::Aug::Internal
