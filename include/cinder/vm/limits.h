/**
 * @file limits.h
 * @brief Hard limits shared by the Sandbox, Interpreter and JIT
 */
#pragma once
#include <cstddef>

namespace cinder {

    // Kích thước vùng nhớ mặc định khi chương trình không khai báo `.memory`
    static constexpr size_t DEFAULT_MEMORY_SIZE = 1024;

    // Interpreter luôn cấp phát ít nhất chừng này ô nhớ
    static constexpr size_t MIN_INTERPRETER_MEMORY = 1024;

    // Giới hạn trên của memory_size mà Sandbox chấp nhận
    static constexpr size_t MAX_MEMORY_CELLS = 65536;

    // Độ sâu tối đa của operand stack
    static constexpr size_t MAX_STACK_DEPTH = 4096;

} // namespace cinder
