/**
 * @file jit_compiler.h
 * @brief Public entry point: validate -> allocate -> emit -> patch -> finalize
 */
#pragma once
#include <cinder/bytecode/program.h>
#include <cinder/jit/executable_memory.h>
#include <cinder/sandbox/sandbox.h>
#include <cinder/vm/native_table.h>

namespace cinder::jit {

class JitCompiler {
public:
    explicit JitCompiler(Program program, const NativeTable& natives = NativeTable::builtins());

    JitCompiler(const JitCompiler&) = delete;
    JitCompiler& operator=(const JitCompiler&) = delete;

    /**
     * @brief Biên dịch chương trình thành mã x86-64 gọi được.
     * @throws ValidationError, AllocationError, EmissionError
     */
    [[nodiscard]] FinalizedCode compile();

    /// Cận trên số byte cần cho chương trình (không bao giờ nhỏ hơn thực tế)
    [[nodiscard]] size_t estimate_code_size() const noexcept;

    /// Cho phép thêm native id trước khi compile
    void allow_native(uint32_t id) { sandbox_.allow_native(id); }

    [[nodiscard]] Sandbox& sandbox() noexcept { return sandbox_; }
    [[nodiscard]] const Program& program() const noexcept { return sandbox_.program(); }

private:
    Sandbox sandbox_;
    const NativeTable& natives_;
};

} // namespace cinder::jit
