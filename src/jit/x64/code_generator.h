#pragma once

#include "jit/x64/assembler.h"
#include "jit/x64/common.h"
#include <cinder/errors.h>
#include <cinder/sandbox/sandbox.h>
#include <cinder/vm/native_table.h>
#include <meow_flat_map.h>
#include <array>
#include <vector>

namespace cinder::jit::x64 {

enum class PatchKind : uint8_t {
    Branch,      // target = chỉ số lệnh bytecode
    NativeCall,  // target = native id, trỏ vào slot trong literal pool
    FaultStub    // target = ExecError
};

// Một rel32 chưa biết giá trị, được ghi 0 lúc emit và sửa ở pha resolve
struct Patch {
    size_t site;        // Offset của trường rel32 (lệnh kết thúc tại site + 4)
    PatchKind kind;
    uint64_t target;
    bool resolved = false;
};

class CodeGenerator {
public:
    // `policy` quyết định native nào được gọi, độc lập với layout đã phân tích
    CodeGenerator(ExecutableMemory& memory, const Program& program, const StackLayout& layout,
                  const Sandbox& policy, const NativeTable& natives);

    // Sinh toàn bộ mã và resolve patch table. Trả về số byte đã dùng.
    size_t generate();

    [[nodiscard]] const std::vector<Patch>& patches() const noexcept { return patches_; }

private:
    static constexpr size_t FAULT_KINDS = 8;
    static constexpr size_t NO_OFFSET = static_cast<size_t>(-1);

    Assembler asm_;
    const Program& program_;
    const StackLayout& layout_;
    const Sandbox& policy_;
    const NativeTable& natives_;

    // Map từ chỉ số lệnh -> Native Code Offset
    std::vector<size_t> insn_offsets_;
    std::vector<Patch> patches_;
    std::array<size_t, FAULT_KINDS> fault_stubs_;
    meow::flat_map<uint32_t, size_t> native_slots_;

    // --- Helpers ---
    void emit_prologue();
    void emit_return(HeightRange height);
    void emit_instruction(size_t index, const Instruction& inst);
    void emit_binary(OpCode op);
    void emit_compare(Condition cond);
    void emit_div();
    void emit_call_native(size_t index, uint32_t id);

    void emit_fault_stubs();
    void emit_native_pool();
    void resolve_patches();

    // Ghi nhận rel32 vừa emit (4 byte cuối) vào patch table
    void record_patch(PatchKind kind, uint64_t target);

    [[nodiscard]] size_t frame_size() const noexcept;
    [[nodiscard]] static int32_t cell_disp(size_t offset) noexcept;
};

} // namespace cinder::jit::x64
