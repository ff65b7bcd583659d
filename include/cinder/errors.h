/**
 * @file errors.h
 * @brief Error taxonomy: thrown compile-time errors + value-returned execution faults
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cinder {

// --- Compile-time (thrown) ---

enum class ValidationErrorKind : uint8_t {
    InvalidMemorySize,
    OutOfBoundsJump,
    OutOfBoundsMemoryAccess,
    DisallowedNativeCall,
    StackUnderflow,
    StackOverflow
};

enum class AllocationErrorKind : uint8_t {
    ZeroSizeRequested,
    OsAllocationDenied
};

enum class EmissionErrorKind : uint8_t {
    WriteOutOfBounds,
    UnresolvedPatch,
    DisallowedNativeAtEmission
};

class CinderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ValidationError : public CinderError {
public:
    static constexpr size_t NO_INDEX = static_cast<size_t>(-1);

    ValidationError(ValidationErrorKind kind, size_t index, const std::string& message)
        : CinderError(message), kind_(kind), index_(index) {}

    [[nodiscard]] ValidationErrorKind kind() const noexcept { return kind_; }
    /// Chỉ số lệnh vi phạm, NO_INDEX nếu lỗi ở mức chương trình
    [[nodiscard]] size_t index() const noexcept { return index_; }
private:
    ValidationErrorKind kind_;
    size_t index_;
};

class AllocationError : public CinderError {
public:
    AllocationError(AllocationErrorKind kind, const std::string& message)
        : CinderError(message), kind_(kind) {}
    [[nodiscard]] AllocationErrorKind kind() const noexcept { return kind_; }
private:
    AllocationErrorKind kind_;
};

class EmissionError : public CinderError {
public:
    EmissionError(EmissionErrorKind kind, const std::string& message)
        : CinderError(message), kind_(kind) {}
    [[nodiscard]] EmissionErrorKind kind() const noexcept { return kind_; }
private:
    EmissionErrorKind kind_;
};

// --- Run-time (returned) ---

enum class ExecError : uint8_t {
    StackUnderflow,
    StackOverflow,
    InvalidMemoryAccess,
    InvalidJumpTarget,
    DivisionByZero,
    DisallowedNativeCall,
    UnknownNative
};

/**
 * @brief Lỗi khi thực thi, trả về qua meow::expected thay vì throw.
 * @note pc = UNKNOWN_PC khi lỗi phát sinh trong mã máy đã JIT.
 */
struct ExecFault {
    static constexpr size_t UNKNOWN_PC = static_cast<size_t>(-1);

    ExecError kind = ExecError::StackUnderflow;
    size_t pc = UNKNOWN_PC;

    bool operator==(const ExecFault&) const = default;
};

[[nodiscard]] std::string_view to_string(ValidationErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(AllocationErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(EmissionErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ExecError kind) noexcept;
[[nodiscard]] std::string describe(const ExecFault& fault);

} // namespace cinder
