#include <cinder/bytecode/disassemble.h>
#include <algorithm>
#include <format>

namespace cinder {

std::string to_string(const Instruction& inst) {
    std::string_view name = mnemonic(inst.op);
    switch (get_op_info(inst.op).operand) {
        case OperandKind::NONE:      return std::string(name);
        case OperandKind::IMM64:     return std::format("{} {}", name, inst.imm());
        case OperandKind::REG8:      return std::format("{} r{}", name, inst.reg());
        case OperandKind::TARGET:    return std::format("{} @{}", name, inst.target());
        case OperandKind::OFFSET:    return std::format("{} [{}]", name, inst.offset());
        case OperandKind::NATIVE_ID: return std::format("{} 0x{:02X}", name, inst.native_id());
    }
    return std::string(name);
}

std::string disassemble(const Program& program) {
    std::string out = std::format(".memory {}\n", program.memory_size());
    for (size_t i = 0; i < program.size(); ++i) {
        std::format_to(std::back_inserter(out), "{:04}: {}\n", i, to_string(program[i]));
    }
    return out;
}

std::string hex_dump(std::span<const uint8_t> bytes, size_t limit) {
    const size_t count = std::min(bytes.size(), limit);
    std::string out;
    for (size_t row = 0; row < count; row += 16) {
        std::format_to(std::back_inserter(out), "{:04X}: ", row);
        const size_t end = std::min(row + 16, count);
        for (size_t i = row; i < end; ++i) {
            std::format_to(std::back_inserter(out), "{:02X}{}", bytes[i], i + 1 < end ? " " : "");
        }
        out += '\n';
    }
    if (bytes.size() > count) {
        std::format_to(std::back_inserter(out), "... ({} more bytes)\n", bytes.size() - count);
    }
    return out;
}

} // namespace cinder
