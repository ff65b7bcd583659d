/**
 * @file sandbox.h
 * @brief Static safety gate that every program passes before native code exists
 */
#pragma once
#include <cinder/bytecode/program.h>
#include <cinder/errors.h>
#include <cinder/sandbox/stack_analysis.h>
#include <cinder/vm/native_table.h>
#include <optional>

namespace cinder {

class Sandbox {
public:
    explicit Sandbox(Program program);

    /**
     * @brief Kiểm tra toàn bộ chương trình, theo thứ tự:
     * memory size -> từng lệnh (jump, memory, native) -> phân tích stack.
     * @throws ValidationError tại vi phạm đầu tiên.
     * @note Thành công thì kết quả được giữ lại, các lần gọi sau không làm gì.
     */
    void validate();

    [[nodiscard]] bool is_native_allowed(uint32_t id) const noexcept { return whitelist_.contains(id); }

    /// @throws std::logic_error nếu đã validate
    void allow_native(uint32_t id);

    [[nodiscard]] bool is_validated() const noexcept { return layout_.has_value(); }

    /// @throws std::logic_error nếu chưa validate
    [[nodiscard]] const StackLayout& stack_layout() const;

    [[nodiscard]] const Program& program() const noexcept { return program_; }
    [[nodiscard]] const NativeWhitelist& whitelist() const noexcept { return whitelist_; }

private:
    Program program_;
    NativeWhitelist whitelist_;
    std::optional<StackLayout> layout_;

    void check_memory_size() const;
    void check_instruction(size_t index, const Instruction& inst) const;
};

} // namespace cinder
