/**
 * @file stack_analysis.h
 * @brief Abstract interpretation of operand-stack heights over the control-flow graph
 */
#pragma once
#include <cinder/bytecode/program.h>
#include <cstdint>
#include <vector>

namespace cinder {

/// Khoảng chiều cao stack [min, max] có thể gặp tại một điểm trong chương trình
struct HeightRange {
    static constexpr int32_t UNREACHABLE = -1;

    int32_t min = UNREACHABLE;
    int32_t max = UNREACHABLE;

    [[nodiscard]] bool reachable() const noexcept { return min != UNREACHABLE; }
    [[nodiscard]] bool exact() const noexcept { return min == max; }

    bool operator==(const HeightRange&) const = default;
};

/**
 * @brief Kết quả phân tích stack: khoảng chiều cao tại đầu mỗi lệnh reachable.
 * @details Các nhánh có thể hợp lại với chiều cao khác nhau. `min` chứng minh
 * không có underflow, `max` chứng minh không vượt MAX_STACK_DEPTH. JIT dùng
 * `exact()` để biết khi nào được phép bỏ qua kiểm tra lúc chạy.
 */
struct StackLayout {
    std::vector<HeightRange> entry;
    HeightRange exit;            // Khi rơi khỏi lệnh cuối
    int32_t max_depth = 0;

    [[nodiscard]] bool reachable(size_t index) const noexcept {
        return index < entry.size() && entry[index].reachable();
    }
    [[nodiscard]] bool falls_off_end() const noexcept { return exit.reachable(); }
};

/// @throws ValidationError (StackUnderflow, StackOverflow, OutOfBoundsJump)
[[nodiscard]] StackLayout analyze_stack(const Program& program);

} // namespace cinder
