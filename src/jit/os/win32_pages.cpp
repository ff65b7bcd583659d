#include <cinder/jit/page_backend.h>
#include "jit/jit_config.h"
#include <print>
#include <windows.h>

namespace cinder::jit {

namespace {
    class Win32PageBackend final : public PageBackend {
    public:
        Region allocate_rwx(size_t size) override {
            void* ptr = VirtualAlloc(nullptr, size, MEM_COMMIT | MEM_RESERVE, PAGE_EXECUTE_READWRITE);
            if (!ptr) {
                if constexpr (JIT_DEBUG_LOG) {
                    std::println(stderr, "[JIT] VirtualAlloc failed for {} bytes", size);
                }
                return {};
            }
            return {static_cast<uint8_t*>(ptr), size};
        }

        void release(Region region) noexcept override {
            if (region.base) VirtualFree(region.base, 0, MEM_RELEASE);
        }
    };
}

PageBackend& system_page_backend() {
    static Win32PageBackend backend;
    return backend;
}

} // namespace cinder::jit
