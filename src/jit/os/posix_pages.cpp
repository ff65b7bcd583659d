#include <cinder/jit/page_backend.h>
#include "jit/jit_config.h"
#include <print>
#include <sys/mman.h>

namespace cinder::jit {

namespace {
    // Vùng nhớ RWX suốt vòng đời; không chuyển W -> X bằng mprotect
    class PosixPageBackend final : public PageBackend {
    public:
        Region allocate_rwx(size_t size) override {
            void* ptr = mmap(nullptr, size,
                             PROT_READ | PROT_WRITE | PROT_EXEC,
                             MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (ptr == MAP_FAILED) {
                if constexpr (JIT_DEBUG_LOG) {
                    std::println(stderr, "[JIT] mmap failed for {} bytes", size);
                }
                return {};
            }
            return {static_cast<uint8_t*>(ptr), size};
        }

        void release(Region region) noexcept override {
            if (region.base) munmap(region.base, region.size);
        }
    };
}

PageBackend& system_page_backend() {
    static PosixPageBackend backend;
    return backend;
}

} // namespace cinder::jit
