/**
 * @file Cutout.cpp
 * @brief Region masking implementation
 */

#include <PixAug/Dropout/Cutout.h>
#include <PixAug/Core/Constants.h>
#include <PixAug/Core/PixelTraits.h>
#include <PixAug/Core/Validate.h>

#include <algorithm>
#include <string>
#include <utility>

namespace Pix::Aug::Dropout {

namespace {

void RequireHoleInside(const Hole& hole, int32_t height, int32_t width, size_t index) {
    const bool xOk = hole.x1 >= 0 && hole.x1 <= hole.x2 && hole.x2 <= width;
    const bool yOk = hole.y1 >= 0 && hole.y1 <= hole.y2 && hole.y2 <= height;
    if (!xOk || !yOk) {
        throw OutOfRangeException(
            "Cutout: hole " + std::to_string(index) + " (" +
            std::to_string(hole.x1) + ", " + std::to_string(hole.y1) + ", " +
            std::to_string(hole.x2) + ", " + std::to_string(hole.y2) +
            ") outside " + std::to_string(width) + "x" + std::to_string(height) + " image");
    }
}

} // anonymous namespace

void Cutout(const PImage& image, PImage& output,
            const std::vector<Hole>& holes, double fillValue) {
    PIXAUG_REQUIRE_IMAGE(image);

    const int32_t height = image.Height();
    const int32_t width = image.Width();
    for (size_t i = 0; i < holes.size(); ++i) {
        RequireHoleInside(holes[i], height, width, i);
    }

    PImage result = image.Clone();

    DispatchPixelType(result.Type(), [&](auto tag) {
        using T = typename decltype(tag)::Type;
        const T fill = PixelCast<T>(fillValue);

        for (int32_t c = 0; c < result.Channels(); ++c) {
            T* plane = result.PlanePtr<T>(c);
            for (const Hole& hole : holes) {
                if (hole.IsEmpty()) continue;
                for (int32_t y = hole.y1; y < hole.y2; ++y) {
                    T* row = plane + static_cast<size_t>(y) * width;
                    std::fill(row + hole.x1, row + hole.x2, fill);
                }
            }
        }
    });

    output = std::move(result);
}

std::vector<Hole> GenerateCutoutHoles(int32_t height, int32_t width,
                                      const CutoutParams& params,
                                      Platform::Random& rng) {
    PIXAUG_REQUIRE_NON_NEGATIVE(height);
    PIXAUG_REQUIRE_NON_NEGATIVE(width);
    Validate::RequireNonNegative(params.numHoles, "numHoles", "GenerateCutoutHoles");
    Validate::RequireNonNegative(params.maxHoleHeight, "maxHoleHeight", "GenerateCutoutHoles");
    Validate::RequireNonNegative(params.maxHoleWidth, "maxHoleWidth", "GenerateCutoutHoles");

    std::vector<Hole> holes;
    holes.reserve(static_cast<size_t>(params.numHoles));

    for (int32_t n = 0; n < params.numHoles; ++n) {
        const int32_t y = rng.Int(0, height);
        const int32_t x = rng.Int(0, width);

        const int32_t y1 = Clamp(y - params.maxHoleHeight / 2, 0, height);
        const int32_t y2 = Clamp(y1 + params.maxHoleHeight, 0, height);
        const int32_t x1 = Clamp(x - params.maxHoleWidth / 2, 0, width);
        const int32_t x2 = Clamp(x1 + params.maxHoleWidth, 0, width);

        holes.emplace_back(x1, y1, x2, y2);
    }
    return holes;
}

void RandomCutout(const PImage& image, PImage& output,
                  const CutoutParams& params, Platform::Random& rng) {
    PIXAUG_REQUIRE_IMAGE(image);
    const auto holes = GenerateCutoutHoles(image.Height(), image.Width(), params, rng);
    Cutout(image, output, holes, params.fillValue);
}

} // namespace Pix::Aug::Dropout
