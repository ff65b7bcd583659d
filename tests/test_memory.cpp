#include "test_utils.h"
#include <cinder/jit/executable_memory.h>
#include <array>
#include <vector>

using namespace cinder;
using namespace cinder::jit;
using namespace cinder::tests;

// Backend giả: cấp phát từ heap và đếm số lần release
class CountingBackend final : public PageBackend {
public:
    int allocations = 0;
    int releases = 0;
    bool deny = false;

    Region allocate_rwx(size_t size) override {
        if (deny) return {};
        ++allocations;
        auto* base = new uint8_t[size]{};
        return {base, size};
    }

    void release(Region region) noexcept override {
        ++releases;
        delete[] region.base;
    }
};

static auto expect_alloc(AllocationErrorKind kind) {
    return [kind](const AllocationError& e) { CHECK(e.kind() == kind); };
}

static void zero_size_is_rejected() {
    CountingBackend backend;
    CHECK_THROWS(AllocationError, ExecutableMemory::allocate(0, backend), expect_alloc(AllocationErrorKind::ZeroSizeRequested));
    CHECK_EQ(backend.allocations, 0);
}

static void os_denial_is_reported() {
    CountingBackend backend;
    backend.deny = true;
    CHECK_THROWS(AllocationError, ExecutableMemory::allocate(64, backend), expect_alloc(AllocationErrorKind::OsAllocationDenied));
}

static void system_backend_allocates() {
    ExecutableMemory memory = ExecutableMemory::allocate(64);
    CHECK_EQ(memory.size(), size_t{64});
    CHECK(memory.as_ptr() != nullptr);
}

static void writes_stay_in_bounds() {
    CountingBackend backend;
    ExecutableMemory memory = ExecutableMemory::allocate(64, backend);
    CHECK_EQ(memory.size(), size_t{64});

    const std::array<uint8_t, 4> marker = {0xDE, 0xAD, 0xBE, 0xEF};
    memory.write(60, marker);
    CHECK_EQ(memory.as_ptr()[60], 0xDE);
    CHECK_EQ(memory.as_ptr()[63], 0xEF);
    CHECK_EQ(memory.used(), size_t{64});

    const std::array<uint8_t, 8> overflow = {1, 2, 3, 4, 5, 6, 7, 8};
    auto check = [](const EmissionError& e) { CHECK(e.kind() == EmissionErrorKind::WriteOutOfBounds); };
    CHECK_THROWS(EmissionError, memory.write(60, overflow), check);
    CHECK_THROWS(EmissionError, memory.write(65, std::span<const uint8_t>(overflow.data(), 1)), check);

    // Ghi lỗi không được làm thay đổi vùng nhớ
    CHECK_EQ(memory.as_ptr()[60], 0xDE);
    CHECK_EQ(memory.as_ptr()[61], 0xAD);
    CHECK_EQ(memory.as_ptr()[62], 0xBE);
    CHECK_EQ(memory.as_ptr()[63], 0xEF);
    CHECK_EQ(memory.as_ptr()[59], 0x00);

    // Ghi rỗng ngay tại cuối vùng nhớ là hợp lệ
    memory.write(64, std::span<const uint8_t>{});
}

static void release_exactly_once() {
    CountingBackend backend;
    {
        ExecutableMemory a = ExecutableMemory::allocate(32, backend);
        ExecutableMemory b = std::move(a);
        CHECK(a.as_ptr() == nullptr);
        CHECK_EQ(a.size(), size_t{0});
        CHECK_EQ(b.size(), size_t{32});

        ExecutableMemory c = ExecutableMemory::allocate(16, backend);
        c = std::move(b);                // c giải phóng vùng 16 byte cũ
        CHECK_EQ(backend.releases, 1);
        CHECK_EQ(c.size(), size_t{32});
    }
    CHECK_EQ(backend.allocations, 2);
    CHECK_EQ(backend.releases, 2);
}

static void finalize_transfers_ownership() {
    CountingBackend backend;
    {
        ExecutableMemory memory = ExecutableMemory::allocate(16, backend);
        const std::array<uint8_t, 2> bytes = {0x90, 0xC3};
        memory.write(0, bytes);
        uint8_t* base = memory.as_ptr();

        FinalizedCode code = std::move(memory).finalize();
        CHECK(memory.as_ptr() == nullptr);
        CHECK(code.as_ptr() == base);
        CHECK_EQ(code.size(), size_t{16});
        CHECK_EQ(code.bytes().size(), size_t{2});
        CHECK_EQ(code.bytes()[1], 0xC3);

        FinalizedCode moved = std::move(code);
        CHECK(moved.as_ptr() == base);
        CHECK_EQ(backend.releases, 0);
    }
    CHECK_EQ(backend.releases, 1);
}

int main() {
    static constexpr TestCase cases[] = {
        {"zero size is rejected", zero_size_is_rejected},
        {"OS denial is reported", os_denial_is_reported},
        {"system backend allocates", system_backend_allocates},
        {"writes stay in bounds", writes_stay_in_bounds},
        {"release happens exactly once", release_exactly_once},
        {"finalize transfers ownership", finalize_transfers_ownership},
    };
    return run_tests("executable memory", cases);
}
