#include <cinder/bytecode/op_codes.h>
#include <array>
#include <cctype>

namespace cinder {

namespace {
    struct OpSlot {
        bool defined = false;
        std::string_view name;
    };

    template <OpCode... Ops>
    consteval auto make_table() {
        std::array<OpSlot, 256> table{};
        ((table[static_cast<size_t>(Ops)] = OpSlot{true, meow::enum_name<Ops>()}), ...);
        return table;
    }

    using enum OpCode;
    constexpr auto OP_TABLE = make_table<
        PUSH_INT, PUSH_REG, POP,
        ADD, SUB, MUL, DIV,
        EQ, LT, GT,
        JUMP, JUMP_IF_ZERO, JUMP_IF_NOT_ZERO,
        LOAD, STORE,
        CALL_NATIVE, RETURN,
        HALT
    >();

    bool iequals(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(a[i])) != static_cast<unsigned char>(b[i])) return false;
        }
        return true;
    }
}

std::optional<OpCode> from_byte(uint8_t byte) noexcept {
    if (!OP_TABLE[byte].defined) return std::nullopt;
    return static_cast<OpCode>(byte);
}

std::optional<OpCode> from_mnemonic(std::string_view text) noexcept {
    for (size_t i = 0; i < OP_TABLE.size(); ++i) {
        if (OP_TABLE[i].defined && iequals(text, OP_TABLE[i].name)) return static_cast<OpCode>(i);
    }
    return std::nullopt;
}

std::string_view mnemonic(OpCode op) noexcept {
    const auto& slot = OP_TABLE[static_cast<size_t>(op)];
    return slot.defined ? slot.name : std::string_view{"UNKNOWN"};
}

} // namespace cinder
