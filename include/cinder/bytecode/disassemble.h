/**
 * @file disassemble.h
 * @brief Human-readable listings of bytecode and generated machine code
 */
#pragma once
#include <cinder/bytecode/program.h>
#include <cstdint>
#include <span>
#include <string>

namespace cinder {

[[nodiscard]] std::string to_string(const Instruction& inst);

/// Mỗi lệnh một dòng: `NNNN: MNEMONIC operand`
[[nodiscard]] std::string disassemble(const Program& program);

/// 16 byte mỗi dòng, tối đa `limit` byte
[[nodiscard]] std::string hex_dump(std::span<const uint8_t> bytes, size_t limit = 256);

} // namespace cinder
