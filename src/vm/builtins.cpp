#include <cinder/vm/native_table.h>
#include <algorithm>
#include <cstdio>
#include <print>

namespace cinder {

namespace natives {

// print_int(value): in số nguyên kèm xuống dòng
static int64_t print_int(int64_t value) {
    std::println("{}", value);
    return value;
}

// print_char(value): ghi byte thấp ra stdout
static int64_t print_char(int64_t value) {
    std::putchar(static_cast<unsigned char>(value & 0xFF));
    return value;
}

} // namespace natives

const NativeTable& NativeTable::builtins() {
    static const NativeTable table = [] {
        NativeTable t;
        t.register_native(native_ids::PRINT_INT, "print_int", natives::print_int);
        t.register_native(native_ids::PRINT_CHAR, "print_char", natives::print_char);
        return t;
    }();
    return table;
}

void NativeTable::register_native(uint32_t id, std::string name, NativeFn fn) {
    if (NativeEntry* existing = entries_.find(id)) {
        *existing = NativeEntry{std::move(name), fn};
        return;
    }
    entries_.try_emplace(id, NativeEntry{std::move(name), fn});
}

bool NativeWhitelist::contains(uint32_t id) const noexcept {
    return std::find(ids_.begin(), ids_.end(), id) != ids_.end();
}

void NativeWhitelist::allow(uint32_t id) {
    if (!contains(id)) ids_.push_back(id);
}

} // namespace cinder
