#include <cinder/jit/jit_compiler.h>
#include <cinder/bytecode/disassemble.h>
#include "jit/jit_config.h"
#include "jit/x64/code_generator.h"

#include <print>

namespace cinder::jit {

JitCompiler::JitCompiler(Program program, const NativeTable& natives)
    : sandbox_(std::move(program)), natives_(natives) {}

size_t JitCompiler::estimate_code_size() const noexcept {
    return CODE_SIZE_BASE + sandbox_.program().size() * MAX_BYTES_PER_INSTRUCTION;
}

FinalizedCode JitCompiler::compile() {
    // 1. Validate trước khi cấp phát bất kỳ thứ gì
    sandbox_.validate();

    // 2-3. Một vùng RWX duy nhất; lỗi phía sau sẽ được RAII giải phóng
    const size_t capacity = estimate_code_size();
    ExecutableMemory memory = ExecutableMemory::allocate(capacity);

    if constexpr (JIT_DEBUG_LOG) {
        std::println(stderr, "[JIT] Compiling {} instructions into {} bytes at {}",
                     sandbox_.program().size(), capacity, static_cast<const void*>(memory.as_ptr()));
    }

    // 4-8. Emit + patch
    x64::CodeGenerator codegen(memory, sandbox_.program(), sandbox_.stack_layout(), sandbox_, natives_);
    const size_t used = codegen.generate();

    if constexpr (JIT_DEBUG_LOG) {
        std::println(stderr, "[JIT] Emitted {} bytes ({} patches resolved)", used, codegen.patches().size());
        std::print(stderr, "{}", hex_dump({memory.as_ptr(), used}));
    }

    // 9.
    return std::move(memory).finalize();
}

} // namespace cinder::jit
