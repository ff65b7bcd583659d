#include "jit/x64/code_generator.h"
#include "jit/jit_config.h"
#include <format>
#include <limits>

namespace cinder::jit::x64 {

CodeGenerator::CodeGenerator(ExecutableMemory& memory, const Program& program, const StackLayout& layout,
                             const Sandbox& policy, const NativeTable& natives)
    : asm_(memory),
      program_(program),
      layout_(layout),
      policy_(policy),
      natives_(natives) {
    fault_stubs_.fill(NO_OFFSET);
}

// --- Frame layout ---
// [rbp - 8*(i+1)] là ô nhớ i. Phía dưới các ô nhớ là operand stack (native stack).

size_t CodeGenerator::frame_size() const noexcept {
    const size_t bytes = program_.memory_size() * CELL_SIZE;
    return (bytes + STACK_ALIGNMENT - 1) & ~(STACK_ALIGNMENT - 1);
}

int32_t CodeGenerator::cell_disp(size_t offset) noexcept {
    return -static_cast<int32_t>((offset + 1) * CELL_SIZE);
}

void CodeGenerator::record_patch(PatchKind kind, uint64_t target) {
    patches_.push_back({asm_.cursor() - 4, kind, target});
}

void CodeGenerator::emit_prologue() {
    const size_t frame = frame_size();
    asm_.push(RBP);
    asm_.mov(RBP, RSP);
    asm_.sub(RSP, static_cast<int32_t>(frame));

    // Zero-fill memory cells: rep stosq (RDI = dst, RCX = count, RAX = 0)
    asm_.mov(RDI, RSP);
    asm_.mov(RCX, static_cast<int64_t>(frame / CELL_SIZE));
    asm_.xor_(RAX, RAX);
    asm_.rep_stosq();
}

// Trả về cặp RAX:RDX = {top of stack hoặc 0, không lỗi}
void CodeGenerator::emit_return(HeightRange height) {
    if (height.min > 0) {
        asm_.pop(REG_LHS);
    } else if (height.max == 0) {
        asm_.xor_(REG_LHS, REG_LHS);
    } else {
        // Chiều cao phụ thuộc nhánh: stack rỗng khi RSP còn nằm ngay dưới các ô nhớ
        asm_.lea(REG_RHS, REG_FRAME, -static_cast<int32_t>(frame_size()));
        asm_.cmp(RSP, REG_RHS);
        const size_t jne_site = asm_.cursor();
        asm_.jcc_short(NE, 0);
        asm_.xor_(REG_LHS, REG_LHS);
        const size_t jmp_site = asm_.cursor();
        asm_.jmp_short(0);

        asm_.patch_u8(jne_site + 1, static_cast<uint8_t>(asm_.cursor() - (jne_site + 2)));
        asm_.pop(REG_LHS);
        asm_.patch_u8(jmp_site + 1, static_cast<uint8_t>(asm_.cursor() - (jmp_site + 2)));
    }
    asm_.xor_(REG_FAULT, REG_FAULT);
    asm_.mov(RSP, RBP);
    asm_.pop(RBP);
    asm_.ret();
}

// --- Main Compile Loop ---

size_t CodeGenerator::generate() {
    insn_offsets_.assign(program_.size(), NO_OFFSET);
    patches_.clear();

    emit_prologue();

    for (size_t i = 0; i < program_.size(); ++i) {
        insn_offsets_[i] = asm_.cursor();
        if (!layout_.reachable(i)) {
            asm_.int3();
            continue;
        }
        emit_instruction(i, program_[i]);
    }

    // Rơi khỏi lệnh cuối
    emit_return(layout_.falls_off_end() ? layout_.exit : HeightRange{0, 0});

    emit_fault_stubs();
    emit_native_pool();
    resolve_patches();

    return asm_.cursor();
}

void CodeGenerator::emit_instruction(size_t index, const Instruction& inst) {
    using enum OpCode;
    switch (inst.op) {
        case PUSH_INT:
            asm_.mov(REG_LHS, inst.imm());
            asm_.push(REG_LHS);
            break;

        // Không có register file: nhảy thẳng vào stub StackUnderflow
        case PUSH_REG:
            asm_.jmp(0);
            record_patch(PatchKind::FaultStub, static_cast<uint64_t>(ExecError::StackUnderflow));
            break;

        case POP:
            asm_.pop(REG_LHS);
            break;

        case ADD: case SUB: case MUL:
            emit_binary(inst.op);
            break;

        case DIV: emit_div(); break;

        case EQ: emit_compare(E); break;
        case LT: emit_compare(L); break;
        case GT: emit_compare(G); break;

        case JUMP:
            asm_.jmp(0);
            record_patch(PatchKind::Branch, inst.target());
            break;

        case JUMP_IF_ZERO:
        case JUMP_IF_NOT_ZERO:
            asm_.pop(REG_LHS);
            asm_.test(REG_LHS, REG_LHS);
            asm_.jcc(inst.op == JUMP_IF_ZERO ? E : NE, 0);
            record_patch(PatchKind::Branch, inst.target());
            break;

        case LOAD:
            asm_.mov(REG_LHS, REG_FRAME, cell_disp(inst.offset()));
            asm_.push(REG_LHS);
            break;

        case STORE:
            asm_.pop(REG_LHS);
            asm_.mov(REG_FRAME, cell_disp(inst.offset()), REG_LHS);
            break;

        case CALL_NATIVE:
            emit_call_native(index, inst.native_id());
            break;

        case RETURN: case HALT:
            emit_return(layout_.entry[index]);
            break;
    }
}

// pop rcx (phải); pop rax (trái); op rax, rcx; push rax
void CodeGenerator::emit_binary(OpCode op) {
    asm_.pop(REG_RHS);
    asm_.pop(REG_LHS);
    switch (op) {
        case OpCode::ADD: asm_.add(REG_LHS, REG_RHS); break;
        case OpCode::SUB: asm_.sub(REG_LHS, REG_RHS); break;
        default:          asm_.imul(REG_LHS, REG_RHS); break;
    }
    asm_.push(REG_LHS);
}

void CodeGenerator::emit_compare(Condition cond) {
    asm_.pop(REG_RHS);
    asm_.pop(REG_LHS);
    asm_.cmp(REG_LHS, REG_RHS);
    asm_.setcc(cond, REG_LHS);
    asm_.movzx_b(REG_LHS, REG_LHS);
    asm_.push(REG_LHS);
}

/*
 * Divisor = 0   -> stub DivisionByZero
 * Divisor = -1  -> neg (idiv sẽ #DE với INT64_MIN / -1)
 * Còn lại       -> cqo; idiv
 */
void CodeGenerator::emit_div() {
    asm_.pop(REG_RHS);
    asm_.pop(REG_LHS);
    asm_.test(REG_RHS, REG_RHS);
    asm_.jcc(E, 0);
    record_patch(PatchKind::FaultStub, static_cast<uint64_t>(ExecError::DivisionByZero));

    asm_.cmp(REG_RHS, static_cast<int8_t>(-1));
    const size_t jne_site = asm_.cursor();
    asm_.jcc_short(NE, 0);
    asm_.neg(REG_LHS);
    const size_t jmp_site = asm_.cursor();
    asm_.jmp_short(0);

    asm_.patch_u8(jne_site + 1, static_cast<uint8_t>(asm_.cursor() - (jne_site + 2)));
    asm_.cqo();
    asm_.idiv(REG_RHS);

    asm_.patch_u8(jmp_site + 1, static_cast<uint8_t>(asm_.cursor() - (jmp_site + 2)));
    asm_.push(REG_LHS);
}

void CodeGenerator::emit_call_native(size_t index, uint32_t id) {
    // Sandbox đã duyệt, nhưng kiểm tra lại ngay tại điểm sinh mã
    if (!policy_.is_native_allowed(id)) {
        throw EmissionError(EmissionErrorKind::DisallowedNativeAtEmission,
            std::format("Native function 0x{:02X} at instruction {} is not whitelisted", id, index));
    }

    asm_.pop(REG_ARG0);

    const HeightRange entry = layout_.entry[index];
    if (entry.exact()) {
        // RSP = 8 * height (mod 16) sau prologue; call cần RSP chia hết cho 16
        const bool misaligned = ((entry.min - 1) % 2) != 0;
        if (misaligned) asm_.sub(RSP, static_cast<int32_t>(CELL_SIZE));

        asm_.call_rip(0);
        record_patch(PatchKind::NativeCall, id);

        if (misaligned) asm_.add(RSP, static_cast<int32_t>(CELL_SIZE));
    } else {
        // Chiều cao phụ thuộc nhánh: căn RSP lúc chạy, lưu RSP cũ hai lần để giữ bội số 16
        asm_.mov(REG_LHS, RSP);
        asm_.and_(RSP, static_cast<int8_t>(-static_cast<int32_t>(STACK_ALIGNMENT)));
        asm_.push(REG_LHS);
        asm_.push(REG_LHS);

        asm_.call_rip(0);
        record_patch(PatchKind::NativeCall, id);

        asm_.mov(RSP, RSP, 0);
    }
    asm_.push(REG_LHS);
}

// --- Out-of-line tails ---

void CodeGenerator::emit_fault_stubs() {
    for (const Patch& patch : patches_) {
        if (patch.kind != PatchKind::FaultStub) continue;
        const size_t kind = static_cast<size_t>(patch.target);
        if (fault_stubs_[kind] != NO_OFFSET) continue;

        fault_stubs_[kind] = asm_.cursor();
        asm_.mov(REG_FAULT, static_cast<int64_t>(encode_fault(static_cast<ExecError>(kind))));
        asm_.xor_(REG_LHS, REG_LHS);
        asm_.mov(RSP, RBP);
        asm_.pop(RBP);
        asm_.ret();
    }
}

// Mỗi native id một slot 8 byte, địa chỉ hàm được ghi ở pha resolve
void CodeGenerator::emit_native_pool() {
    bool aligned = false;
    for (const Patch& patch : patches_) {
        if (patch.kind != PatchKind::NativeCall) continue;
        const auto id = static_cast<uint32_t>(patch.target);
        if (native_slots_.contains(id)) continue;

        if (!aligned) {
            asm_.align(8);
            aligned = true;
        }
        native_slots_.try_emplace(id, asm_.cursor());
        asm_.emit_u64(0);
    }
}

// --- Resolution pass ---

void CodeGenerator::resolve_patches() {
    for (Patch& patch : patches_) {
        size_t target_offset = NO_OFFSET;

        switch (patch.kind) {
            case PatchKind::Branch:
                if (patch.target < insn_offsets_.size()) target_offset = insn_offsets_[patch.target];
                break;

            case PatchKind::FaultStub:
                if (patch.target < FAULT_KINDS) target_offset = fault_stubs_[patch.target];
                break;

            case PatchKind::NativeCall: {
                const auto id = static_cast<uint32_t>(patch.target);
                const NativeEntry* entry = natives_.find(id);
                const size_t* slot = native_slots_.find(id);
                if (entry == nullptr || entry->fn == nullptr || slot == nullptr) {
                    throw EmissionError(EmissionErrorKind::UnresolvedPatch,
                        std::format("Native function 0x{:02X} has no entry in the native table", id));
                }
                asm_.patch_u64(*slot, reinterpret_cast<uint64_t>(entry->fn));
                target_offset = *slot;
                break;
            }
        }

        if (target_offset == NO_OFFSET) {
            throw EmissionError(EmissionErrorKind::UnresolvedPatch,
                std::format("Patch at offset {} has no resolvable target {}", patch.site, patch.target));
        }

        const int64_t rel = static_cast<int64_t>(target_offset) - static_cast<int64_t>(patch.site + 4);
        if (rel < std::numeric_limits<int32_t>::min() || rel > std::numeric_limits<int32_t>::max()) {
            throw EmissionError(EmissionErrorKind::UnresolvedPatch,
                std::format("Displacement {} at offset {} does not fit in rel32", rel, patch.site));
        }
        asm_.patch_u32(patch.site, static_cast<uint32_t>(static_cast<int32_t>(rel)));
        patch.resolved = true;
    }

    for (const Patch& patch : patches_) {
        if (!patch.resolved) {
            throw EmissionError(EmissionErrorKind::UnresolvedPatch,
                std::format("Patch at offset {} left unresolved", patch.site));
        }
    }
}

} // namespace cinder::jit::x64
