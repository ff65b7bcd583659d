/**
 * @file page_backend.h
 * @brief OS seam for obtaining and returning read-write-execute pages
 */
#pragma once
#include <cstddef>
#include <cstdint>

namespace cinder::jit {

struct Region {
    uint8_t* base = nullptr;
    size_t size = 0;
};

class PageBackend {
public:
    virtual ~PageBackend() = default;

    /// base == nullptr nếu OS từ chối
    [[nodiscard]] virtual Region allocate_rwx(size_t size) = 0;
    virtual void release(Region region) noexcept = 0;
};

/// Backend của hệ điều hành hiện tại (mmap hoặc VirtualAlloc), chọn lúc build
[[nodiscard]] PageBackend& system_page_backend();

} // namespace cinder::jit
