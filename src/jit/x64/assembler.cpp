#include "jit/x64/assembler.h"
#include <array>
#include <cstring>

namespace cinder::jit::x64 {

Assembler::Assembler(ExecutableMemory& memory)
    : memory_(memory), size_(0) {}

// Mọi byte đi qua ExecutableMemory::write, tràn vùng nhớ => EmissionError
void Assembler::emit(uint8_t b) {
    memory_.write(size_, std::span<const uint8_t>(&b, 1));
    ++size_;
}

void Assembler::emit_u32(uint32_t v) {
    std::array<uint8_t, 4> bytes;
    std::memcpy(bytes.data(), &v, 4);
    memory_.write(size_, bytes);
    size_ += 4;
}

void Assembler::emit_u64(uint64_t v) {
    std::array<uint8_t, 8> bytes;
    std::memcpy(bytes.data(), &v, 8);
    memory_.write(size_, bytes);
    size_ += 8;
}

void Assembler::patch_u8(size_t offset, uint8_t value) {
    memory_.write(offset, std::span<const uint8_t>(&value, 1));
}

void Assembler::patch_u32(size_t offset, uint32_t value) {
    std::array<uint8_t, 4> bytes;
    std::memcpy(bytes.data(), &value, 4);
    memory_.write(offset, bytes);
}

void Assembler::patch_u64(size_t offset, uint64_t value) {
    std::array<uint8_t, 8> bytes;
    std::memcpy(bytes.data(), &value, 8);
    memory_.write(offset, bytes);
}

// REX Prefix: 0100 WRXB
void Assembler::emit_rex(bool w, bool r, bool x, bool b) {
    uint8_t rex = 0x40;
    if (w) rex |= 0x08; // 64-bit operand size
    if (r) rex |= 0x04; // Extension of ModR/M reg field
    if (x) rex |= 0x02; // Extension of SIB index field
    if (b) rex |= 0x01; // Extension of ModR/M r/m field
    if (rex != 0x40) emit(rex);
}

void Assembler::emit_modrm(int mode, int reg, int rm) {
    emit(static_cast<uint8_t>((mode << 6) | ((reg & 7) << 3) | (rm & 7)));
}

// [base + disp]: SIB (0x24) phải đứng ngay sau ModRM, trước displacement
void Assembler::emit_mem_operand(Reg reg, Reg base, int32_t disp) {
    int mode;
    if (disp == 0 && (base & 7) != 5) mode = 0;         // [reg]
    else if (disp >= -128 && disp <= 127) mode = 1;    // [reg + disp8]
    else mode = 2;                                     // [reg + disp32]

    emit_modrm(mode, reg, base);
    if ((base & 7) == 4) emit(0x24);

    if (mode == 1) emit(static_cast<uint8_t>(disp));
    else if (mode == 2) emit_u32(static_cast<uint32_t>(disp));
}

// MOV dst, src
void Assembler::mov(Reg dst, Reg src) {
    if (dst == src) return; // NOP
    emit_rex(true, dst >= 8, false, src >= 8);
    emit(0x8B);
    emit_modrm(3, dst, src);
}

// MOV dst, imm64
void Assembler::mov(Reg dst, int64_t imm) {
    // Số dương vừa 32-bit: MOV r32, imm32 (tự zero-extend lên 64)
    if (imm >= 0 && imm <= 0xFFFFFFFFLL) {
        if (dst >= 8) emit(0x41);
        emit(static_cast<uint8_t>(0xB8 | (dst & 7)));
        emit_u32(static_cast<uint32_t>(imm));
    }
    // Số âm vừa 32-bit sign-extended: MOV r64, imm32 (C7 /0)
    else if (imm >= INT32_MIN && imm <= INT32_MAX) {
        emit_rex(true, false, false, dst >= 8);
        emit(0xC7);
        emit_modrm(3, 0, dst);
        emit_u32(static_cast<uint32_t>(imm));
    }
    // Full 64-bit load
    else {
        emit_rex(true, false, false, dst >= 8);
        emit(static_cast<uint8_t>(0xB8 | (dst & 7)));
        emit_u64(static_cast<uint64_t>(imm));
    }
}

// MOV dst, [base + disp]
void Assembler::mov(Reg dst, Reg base, int32_t disp) {
    emit_rex(true, dst >= 8, false, base >= 8);
    emit(0x8B);
    emit_mem_operand(dst, base, disp);
}

// MOV [base + disp], src
void Assembler::mov(Reg base, int32_t disp, Reg src) {
    emit_rex(true, src >= 8, false, base >= 8);
    emit(0x89);
    emit_mem_operand(src, base, disp);
}

void Assembler::lea(Reg dst, Reg base, int32_t disp) {
    emit_rex(true, dst >= 8, false, base >= 8);
    emit(0x8D);
    emit_mem_operand(dst, base, disp);
}

void Assembler::emit_alu(uint8_t opcode, Reg dst, Reg src) {
    emit_rex(true, src >= 8, false, dst >= 8);
    emit(opcode);
    emit_modrm(3, src, dst);
}

void Assembler::add(Reg dst, Reg src) { emit_alu(0x01, dst, src); }
void Assembler::sub(Reg dst, Reg src) { emit_alu(0x29, dst, src); }
void Assembler::xor_(Reg dst, Reg src) { emit_alu(0x31, dst, src); }
void Assembler::cmp(Reg dst, Reg src) { emit_alu(0x39, dst, src); }
void Assembler::test(Reg dst, Reg src) { emit_alu(0x85, dst, src); }

// 81 /0 id và 81 /5 id
void Assembler::add(Reg dst, int32_t imm) {
    emit_rex(true, false, false, dst >= 8);
    emit(0x81); emit_modrm(3, 0, dst);
    emit_u32(static_cast<uint32_t>(imm));
}

void Assembler::sub(Reg dst, int32_t imm) {
    emit_rex(true, false, false, dst >= 8);
    emit(0x81); emit_modrm(3, 5, dst);
    emit_u32(static_cast<uint32_t>(imm));
}

// 83 /4 ib
void Assembler::and_(Reg dst, int8_t imm) {
    emit_rex(true, false, false, dst >= 8);
    emit(0x83); emit_modrm(3, 4, dst);
    emit(static_cast<uint8_t>(imm));
}

// 83 /7 ib
void Assembler::cmp(Reg dst, int8_t imm) {
    emit_rex(true, false, false, dst >= 8);
    emit(0x83); emit_modrm(3, 7, dst);
    emit(static_cast<uint8_t>(imm));
}

void Assembler::imul(Reg dst, Reg src) {
    emit_rex(true, dst >= 8, false, src >= 8);
    emit(0x0F); emit(0xAF);
    emit_modrm(3, dst, src);
}

void Assembler::neg(Reg dst) {
    emit_rex(true, false, false, dst >= 8);
    emit(0xF7); emit_modrm(3, 3, dst);
}

void Assembler::cqo() { emit(0x48); emit(0x99); }

void Assembler::idiv(Reg divisor) {
    emit_rex(true, false, false, divisor >= 8);
    emit(0xF7); emit_modrm(3, 7, divisor);
}

void Assembler::jmp(int32_t rel_offset) { emit(0xE9); emit_u32(static_cast<uint32_t>(rel_offset)); }
void Assembler::jmp_short(int8_t rel_offset) { emit(0xEB); emit(static_cast<uint8_t>(rel_offset)); }

void Assembler::jcc(Condition cond, int32_t rel_offset) {
    emit(0x0F); emit(static_cast<uint8_t>(0x80 | (cond & 0xF))); emit_u32(static_cast<uint32_t>(rel_offset));
}

void Assembler::jcc_short(Condition cond, int8_t rel_offset) {
    emit(static_cast<uint8_t>(0x70 | (cond & 0xF))); emit(static_cast<uint8_t>(rel_offset));
}

// FF /2 với ModRM mode 0, rm = 101 => [RIP + disp32]
void Assembler::call_rip(int32_t disp) {
    emit(0xFF);
    emit_modrm(0, 2, 5);
    emit_u32(static_cast<uint32_t>(disp));
}

void Assembler::ret() { emit(0xC3); }
void Assembler::int3() { emit(0xCC); }

void Assembler::push(Reg r) {
    if (r >= 8) emit(0x41);
    emit(static_cast<uint8_t>(0x50 | (r & 7)));
}

void Assembler::pop(Reg r) {
    if (r >= 8) emit(0x41);
    emit(static_cast<uint8_t>(0x58 | (r & 7)));
}

// SPL/BPL/SIL/DIL cần REX (kể cả 0x40), nếu không sẽ thành AH/CH/DH/BH
void Assembler::setcc(Condition cond, Reg dst) {
    if (dst >= 4) emit(static_cast<uint8_t>(0x40 | (dst >= 8 ? 0x01 : 0x00)));
    emit(0x0F); emit(static_cast<uint8_t>(0x90 | (cond & 0xF)));
    emit_modrm(3, 0, dst);
}

void Assembler::movzx_b(Reg dst, Reg src) {
    emit_rex(true, dst >= 8, false, src >= 8);
    emit(0x0F); emit(0xB6);
    emit_modrm(3, dst, src);
}

void Assembler::rep_stosq() { emit(0xF3); emit(0x48); emit(0xAB); }

void Assembler::align(size_t boundary, uint8_t filler) {
    while ((size_ % boundary) != 0) emit(filler);
}

} // namespace cinder::jit::x64
