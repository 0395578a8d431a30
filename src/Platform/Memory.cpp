/**
 * @file Memory.cpp
 * @brief Aligned buffer allocation
 */

#include <PixAug/Platform/Memory.h>

#include <cstdlib>
#include <cstring>
#include <new>

#ifdef _MSC_VER
#include <malloc.h>
#endif

namespace Pix::Aug::Platform {

void* AlignedAlloc(size_t size, size_t alignment) {
    if (size == 0) return nullptr;

#ifdef _MSC_VER
    return _aligned_malloc(size, alignment);
#else
    void* ptr = nullptr;
    return posix_memalign(&ptr, alignment, size) == 0 ? ptr : nullptr;
#endif
}

void AlignedFree(void* ptr) {
    if (ptr == nullptr) return;

#ifdef _MSC_VER
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

std::shared_ptr<uint8_t> AllocatePixelBuffer(size_t bytes) {
    const size_t padded = AlignedSize(bytes, MEMORY_ALIGNMENT);
    auto* ptr = static_cast<uint8_t*>(AlignedAlloc(padded, MEMORY_ALIGNMENT));
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }

    std::memset(ptr, 0, padded);
    return std::shared_ptr<uint8_t>(ptr, [](uint8_t* p) { AlignedFree(p); });
}

} // namespace Pix::Aug::Platform
