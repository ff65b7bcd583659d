/**
 * @file native_table.h
 * @brief Host function registry and the per-engine whitelist of callable ids
 */
#pragma once
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <vector>
#include <meow_flat_map.h>

namespace cinder {

// Chữ ký duy nhất mà mã JIT và Interpreter biết cách gọi: 1 tham số, 1 kết quả
using NativeFn = int64_t (*)(int64_t);

namespace native_ids {
    static constexpr uint32_t PRINT_INT  = 0x01;
    static constexpr uint32_t PRINT_CHAR = 0x02;
}

struct NativeEntry {
    std::string name;
    NativeFn fn = nullptr;
};

class NativeTable {
public:
    NativeTable() = default;

    /// Bảng mặc định của tiến trình (print_int, print_char)
    [[nodiscard]] static const NativeTable& builtins();

    /// Ghi đè nếu id đã tồn tại
    void register_native(uint32_t id, std::string name, NativeFn fn);

    [[nodiscard]] const NativeEntry* find(uint32_t id) const noexcept { return entries_.find(id); }
    [[nodiscard]] bool contains(uint32_t id) const noexcept { return entries_.contains(id); }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::span<const uint32_t> ids() const noexcept { return entries_.keys(); }

private:
    meow::flat_map<uint32_t, NativeEntry> entries_;
};

class NativeWhitelist {
public:
    static constexpr uint32_t DEFAULT_IDS[] = { native_ids::PRINT_INT, native_ids::PRINT_CHAR };

    NativeWhitelist() : ids_(std::begin(DEFAULT_IDS), std::end(DEFAULT_IDS)) {}

    [[nodiscard]] bool contains(uint32_t id) const noexcept;
    void allow(uint32_t id);
    [[nodiscard]] std::span<const uint32_t> ids() const noexcept { return ids_; }

private:
    std::vector<uint32_t> ids_;
};

} // namespace cinder
