/**
 * @file Normalize.cpp
 * @brief Normalization implementation
 */

#include <PixAug/Normalize/Normalize.h>
#include <PixAug/Core/Validate.h>

#include <cstddef>
#include <string>
#include <utility>

namespace Pix::Aug::Normalize {

namespace {

// Expand a size-1 statistic to one entry per channel
std::vector<float> PerChannel(const std::vector<double>& values, int32_t channels,
                              const char* name) {
    if (values.size() != 1 && values.size() != static_cast<size_t>(channels)) {
        throw InvalidArgumentException(
            std::string("NormalizeImage: ") + name + " must have 1 or " +
            std::to_string(channels) + " values, got " + std::to_string(values.size()));
    }

    std::vector<float> result(static_cast<size_t>(channels));
    for (int32_t c = 0; c < channels; ++c) {
        result[c] = static_cast<float>(values.size() == 1 ? values[0] : values[c]);
    }
    return result;
}

} // anonymous namespace

NormalizeParams NormalizeParams::ImageNet() {
    NormalizeParams params;
    params.mean = {0.485, 0.456, 0.406};
    params.stddev = {0.229, 0.224, 0.225};
    params.maxPixelValue = 255.0;
    return params;
}

void NormalizeImage(const PImage& image, PImage& output,
                    const std::vector<double>& mean,
                    const std::vector<double>& stddev) {
    PIXAUG_REQUIRE_IMAGE(image);

    const int32_t channels = image.Channels();
    const std::vector<float> meanC = PerChannel(mean, channels, "mean");
    const std::vector<float> stdC = PerChannel(stddev, channels, "stddev");

    std::vector<float> denominator(stdC.size());
    for (size_t c = 0; c < stdC.size(); ++c) {
        Validate::RequireFiniteNonZero(stdC[c], "stddev", "NormalizeImage");
        denominator[c] = 1.0f / stdC[c];
    }

    PImage result = image.ConvertTo(PixelType::Float32);
    const std::ptrdiff_t plane = static_cast<std::ptrdiff_t>(result.PlaneSize());

    for (int32_t c = 0; c < channels; ++c) {
        float* data = result.PlanePtr<float>(c);
        const float m = meanC[c];
        const float d = denominator[c];

        #pragma omp parallel for schedule(static)
        for (std::ptrdiff_t i = 0; i < plane; ++i) {
            data[i] = (data[i] - m) * d;
        }
    }

    output = std::move(result);
}

void NormalizeImage(const PImage& image, PImage& output, double mean, double stddev) {
    NormalizeImage(image, output, std::vector<double>{mean}, std::vector<double>{stddev});
}

void NormalizeImage(const PImage& image, PImage& output, const NormalizeParams& params) {
    std::vector<double> mean(params.mean);
    std::vector<double> stddev(params.stddev);
    for (double& m : mean) m *= params.maxPixelValue;
    for (double& s : stddev) s *= params.maxPixelValue;
    NormalizeImage(image, output, mean, stddev);
}

} // namespace Pix::Aug::Normalize
