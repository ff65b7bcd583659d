/**
 * @file program.h
 * @brief Immutable bytecode program: instructions + memory requirement
 */
#pragma once
#include <cinder/bytecode/instruction.h>
#include <cinder/vm/limits.h>
#include <span>
#include <utility>
#include <vector>

namespace cinder {

class Program {
public:
    Program() = default;
    explicit Program(std::vector<Instruction> instructions, size_t memory_size = DEFAULT_MEMORY_SIZE)
        : instructions_(std::move(instructions)), memory_size_(memory_size) {}

    [[nodiscard]] std::span<const Instruction> instructions() const noexcept { return instructions_; }
    [[nodiscard]] const Instruction& operator[](size_t index) const noexcept { return instructions_[index]; }
    [[nodiscard]] size_t size() const noexcept { return instructions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return instructions_.empty(); }
    [[nodiscard]] size_t memory_size() const noexcept { return memory_size_; }

private:
    std::vector<Instruction> instructions_;
    size_t memory_size_ = DEFAULT_MEMORY_SIZE;
};

} // namespace cinder
