#include <cinder/jit/executable_memory.h>
#include <algorithm>
#include <cstring>
#include <format>

namespace cinder::jit {

// --- ExecutableMemory ---

ExecutableMemory ExecutableMemory::allocate(size_t size, PageBackend& backend) {
    if (size == 0) {
        throw AllocationError(AllocationErrorKind::ZeroSizeRequested, "Cannot allocate zero bytes of executable memory");
    }
    Region region = backend.allocate_rwx(size);
    if (region.base == nullptr) {
        throw AllocationError(AllocationErrorKind::OsAllocationDenied,
            std::format("Operating system refused {} bytes of executable memory", size));
    }
    return ExecutableMemory(&backend, region, size);
}

ExecutableMemory::~ExecutableMemory() {
    reset();
}

ExecutableMemory::ExecutableMemory(ExecutableMemory&& other) noexcept
    : backend_(std::exchange(other.backend_, nullptr)),
      region_(std::exchange(other.region_, Region{})),
      size_(std::exchange(other.size_, 0)),
      used_(std::exchange(other.used_, 0)) {}

ExecutableMemory& ExecutableMemory::operator=(ExecutableMemory&& other) noexcept {
    if (this != &other) {
        reset();
        backend_ = std::exchange(other.backend_, nullptr);
        region_ = std::exchange(other.region_, Region{});
        size_ = std::exchange(other.size_, 0);
        used_ = std::exchange(other.used_, 0);
    }
    return *this;
}

void ExecutableMemory::reset() noexcept {
    if (backend_ && region_.base) backend_->release(region_);
    backend_ = nullptr;
    region_ = {};
    size_ = 0;
    used_ = 0;
}

void ExecutableMemory::write(size_t offset, std::span<const uint8_t> bytes) {
    if (offset > size_ || bytes.size() > size_ - offset) {
        throw EmissionError(EmissionErrorKind::WriteOutOfBounds,
            std::format("Write of {} bytes at offset {} exceeds executable region of {} bytes",
                        bytes.size(), offset, size_));
    }
    if (bytes.empty()) return;
    std::memcpy(region_.base + offset, bytes.data(), bytes.size());
    used_ = std::max(used_, offset + bytes.size());
}

FinalizedCode ExecutableMemory::finalize() && {
    return FinalizedCode(std::move(*this));
}

// --- FinalizedCode ---

FinalizedCode::EntryFn FinalizedCode::as_function() const noexcept {
    return reinterpret_cast<EntryFn>(memory_.as_ptr());
}

meow::expected<int64_t, ExecFault> FinalizedCode::invoke() const {
    using PairEntryFn = NativeResult (*)();
    auto entry = reinterpret_cast<PairEntryFn>(memory_.as_ptr());

    NativeResult result = entry();
    if (result.fault != 0) [[unlikely]] {
        return meow::unexpected(ExecFault{static_cast<ExecError>(result.fault - 1), ExecFault::UNKNOWN_PC});
    }
    return result.value;
}

} // namespace cinder::jit
