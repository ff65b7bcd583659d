/**
 * @file jit_config.h
 * @brief Configuration constants for the CinderVM JIT Compiler
 */

#pragma once

#include <cstddef>

#ifndef CINDER_JIT_DEBUG_LOG
#define CINDER_JIT_DEBUG_LOG 0
#endif

namespace cinder::jit {

    // --- Code size estimation ---

    // Prologue + epilogue + fault stubs + padding của literal pool
    static constexpr size_t CODE_SIZE_BASE = 128;

    // DIV là bản dịch dài nhất (28 byte), CALL_NATIVE cần thêm 8 byte slot trong pool
    static constexpr size_t MAX_BYTES_PER_INSTRUCTION = 40;

    // --- Frame layout ---

    static constexpr size_t CELL_SIZE = 8;
    static constexpr size_t STACK_ALIGNMENT = 16;

    // --- Debugging ---

    // In ra thông tin biên dịch và hex dump mã máy (bật bằng CMake option CINDER_JIT_DEBUG_LOG)
    static constexpr bool JIT_DEBUG_LOG = CINDER_JIT_DEBUG_LOG != 0;

} // namespace cinder::jit
