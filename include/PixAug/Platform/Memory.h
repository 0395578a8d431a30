#pragma once

/**
 * @file Memory.h
 * @brief Aligned, zero-filled storage for image planes
 */

#include <PixAug/Core/Constants.h>
#include <PixAug/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace Pix::Aug::Platform {

/**
 * @brief Allocate aligned memory
 * @param size Size in bytes
 * @param alignment Alignment in bytes (power of two, multiple of sizeof(void*))
 * @return Pointer to aligned memory, or nullptr on failure or size 0
 */
PIXAUG_API void* AlignedAlloc(size_t size, size_t alignment = MEMORY_ALIGNMENT);

/// Free memory returned by AlignedAlloc (nullptr is ignored)
PIXAUG_API void AlignedFree(void* ptr);

inline bool IsAligned(const void* ptr, size_t alignment = MEMORY_ALIGNMENT) {
    return (reinterpret_cast<uintptr_t>(ptr) % alignment) == 0;
}

/// Round size up to the alignment boundary
inline size_t AlignedSize(size_t size, size_t alignment = MEMORY_ALIGNMENT) {
    return (size + alignment - 1) & ~(alignment - 1);
}

/**
 * @brief Shared, zero-filled pixel buffer
 *
 * The allocation is padded to a whole number of alignment blocks so that
 * every plane loop may read up to the padded end.
 *
 * @param bytes Requested size, > 0
 * @throws std::bad_alloc if the allocation fails
 */
PIXAUG_API std::shared_ptr<uint8_t> AllocatePixelBuffer(size_t bytes);

} // namespace Pix::Aug::Platform
