/**
 * @file snow_cutout_demo.cpp
 * @brief 示例：雪景与遮挡增强 / Example: Snow and Cutout Augmentation
 *
 * Usage: snow_cutout_demo [input.png] [seed]
 */

#include <PixAug/PixAug.h>

#include <cstdio>
#include <cstdlib>
#include <exception>

using namespace Pix::Aug;

namespace {

// Diagonal RGB gradient used when no input is given
PImage MakeGradient(int32_t width, int32_t height) {
    PImage img(3, height, width, PixelType::UInt8);
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            img.SetAt<uint8_t>(0, y, x, static_cast<uint8_t>(x * 255 / (width - 1)));
            img.SetAt<uint8_t>(1, y, x, static_cast<uint8_t>(y * 255 / (height - 1)));
            img.SetAt<uint8_t>(2, y, x, static_cast<uint8_t>(((x + y) / 2) % 256));
        }
    }
    return img;
}

} // anonymous namespace

int main(int argc, char** argv) {
    printf("=== PixAug %s Sample: Snow and Cutout ===\n\n", GetVersion());

    try {
        // 1. 加载或生成图像 / Load or synthesize image
        PImage image;
        if (argc > 1) {
            printf("1. Loading '%s'...\n", argv[1]);
            image = PImage::FromFile(argv[1]);
        } else {
            printf("1. Creating a 320x240 RGB gradient...\n");
            image = MakeGradient(320, 240);
        }
        printf("   Size: %dx%d, Channels: %d\n",
               image.Width(), image.Height(), image.Channels());

        if (image.Channels() != 3) {
            printf("   Need a 3-channel RGB image.\n");
            return 1;
        }

        // 2. 固定随机种子 / Fix random seed
        const uint64_t seed = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 42;
        Platform::Random& rng = Platform::Random::Instance();
        rng.SetSeed(seed);
        printf("\n2. Random seed: %llu\n", static_cast<unsigned long long>(seed));

        // 3. 雪景 / Snow
        printf("\n3. Applying snow...\n");
        Weather::SnowParams snowParams;
        PImage snowy;
        {
            Platform::ScopedTimer timer("   RandomSnow");
            Weather::RandomSnow(image, snowy, snowParams, rng);
        }

        // 4. 遮挡 / Cutout
        printf("\n4. Applying cutout...\n");
        Dropout::CutoutParams cutoutParams;
        cutoutParams.numHoles = 12;
        cutoutParams.maxHoleHeight = image.Height() / 10;
        cutoutParams.maxHoleWidth = image.Width() / 10;
        const auto holes = Dropout::GenerateCutoutHoles(image.Height(), image.Width(),
                                                        cutoutParams, rng);
        PImage masked;
        Dropout::Cutout(snowy, masked, holes, cutoutParams.fillValue);
        printf("   Holes: %zu, first at (%d, %d)-(%d, %d)\n", holes.size(),
               holes[0].x1, holes[0].y1, holes[0].x2, holes[0].y2);

        // 5. 保存 / Save
        const char* outputPath = "output_snow_cutout.png";
        printf("\n5. Saving result to '%s'...\n", outputPath);
        if (masked.SaveToFile(outputPath)) {
            printf("   Success!\n");
        } else {
            printf("   Failed to save.\n");
        }

        // 6. 归一化 / Normalize for a network input
        printf("\n6. ImageNet normalization:\n");
        PImage normalized;
        Normalize::NormalizeImage(masked, normalized, Normalize::NormalizeParams::ImageNet());
        printf("   Type: %s, R(0,0) = %.4f\n",
               PixelTypeName(normalized.Type()), normalized.At<float>(0, 0, 0));

        // 7. 性能 / Benchmark
        printf("\n7. Benchmark (OpenMP %s):\n", HasOpenMP() ? "on" : "off");
        PImage scratch;
        auto snowResult = Platform::BenchmarkDetailed([&]() {
            Weather::AddSnow(image, scratch, 0.3, snowParams.brightnessCoeff);
        }, 20, 2);
        Platform::PrintBenchmarkResult("AddSnow", snowResult);

        auto cutoutResult = Platform::BenchmarkDetailed([&]() {
            Dropout::RandomCutout(image, scratch, cutoutParams, rng);
        }, 20, 2);
        Platform::PrintBenchmarkResult("RandomCutout", cutoutResult);
    } catch (const Exception& e) {
        printf("Error: %s\n", e.what());
        return 1;
    }

    printf("\n=== Done ===\n");
    return 0;
}
