/**
 * @file executable_memory.h
 * @brief Owned RWX region for generated code and the callable handle it becomes
 */
#pragma once
#include <cinder/errors.h>
#include <cinder/jit/page_backend.h>
#include <meow_expected.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace cinder::jit {

class FinalizedCode;

class ExecutableMemory {
public:
    /// @throws AllocationError (ZeroSizeRequested, OsAllocationDenied)
    [[nodiscard]] static ExecutableMemory allocate(size_t size, PageBackend& backend = system_page_backend());

    ~ExecutableMemory();
    ExecutableMemory(ExecutableMemory&& other) noexcept;
    ExecutableMemory& operator=(ExecutableMemory&& other) noexcept;
    ExecutableMemory(const ExecutableMemory&) = delete;
    ExecutableMemory& operator=(const ExecutableMemory&) = delete;

    /// @throws EmissionError(WriteOutOfBounds), vùng nhớ giữ nguyên
    void write(size_t offset, std::span<const uint8_t> bytes);

    [[nodiscard]] uint8_t* as_ptr() const noexcept { return region_.base; }
    [[nodiscard]] size_t size() const noexcept { return size_; }
    /// Vị trí cao nhất đã được ghi
    [[nodiscard]] size_t used() const noexcept { return used_; }

    [[nodiscard]] FinalizedCode finalize() &&;

private:
    ExecutableMemory(PageBackend* backend, Region region, size_t size) noexcept
        : backend_(backend), region_(region), size_(size) {}

    void reset() noexcept;

    PageBackend* backend_ = nullptr;
    Region region_;
    size_t size_ = 0;
    size_t used_ = 0;
};

// --- Native return ABI ---
// Mã sinh ra trả về cặp RAX:RDX. RDX = 0 là thành công, ngược lại là 1 + ExecError.
struct NativeResult {
    int64_t value;
    uint64_t fault;
};

[[nodiscard]] constexpr uint64_t encode_fault(ExecError kind) noexcept {
    return static_cast<uint64_t>(kind) + 1;
}

class FinalizedCode {
public:
    using EntryFn = int64_t (*)();

    FinalizedCode(FinalizedCode&&) noexcept = default;
    FinalizedCode& operator=(FinalizedCode&&) noexcept = default;

    /// Entry thô: bỏ qua kênh lỗi RDX
    [[nodiscard]] EntryFn as_function() const noexcept;

    /// Gọi mã đã biên dịch, ánh xạ lỗi runtime sang ExecFault
    [[nodiscard]] meow::expected<int64_t, ExecFault> invoke() const;

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return {memory_.as_ptr(), memory_.used()}; }
    [[nodiscard]] const uint8_t* as_ptr() const noexcept { return memory_.as_ptr(); }
    [[nodiscard]] size_t size() const noexcept { return memory_.size(); }

private:
    friend class ExecutableMemory;
    explicit FinalizedCode(ExecutableMemory memory) noexcept : memory_(std::move(memory)) {}

    ExecutableMemory memory_;
};

} // namespace cinder::jit
