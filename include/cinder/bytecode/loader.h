/**
 * @file loader.h
 * @brief Text assembly loader (.cinder files) producing a Program
 */
#pragma once
#include <cinder/bytecode/program.h>
#include <meow_zerr.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace cinder {

enum class LoadError : uint8_t {
    OK = 0,
    FILE_OPEN_FAILED,
    UNKNOWN_OPCODE,
    MISSING_OPERAND,
    INVALID_OPERAND,
    UNEXPECTED_OPERAND,
    INVALID_DIRECTIVE
};

using LoadStatus = meow::Status<LoadError>;
using LoadResult = meow::Result<Program, LoadError>;

/**
 * @brief Định dạng dòng:
 *   `# comment`, `.memory N`, hoặc `MNEMONIC [operand]`.
 * Mnemonic không phân biệt hoa thường, số nguyên ở dạng thập phân hoặc 0x hex.
 */
class TextLoader {
public:
    [[nodiscard]] static LoadResult parse(std::string_view source, std::string_view filename = "<memory>");
    [[nodiscard]] static LoadResult load_file(const std::string& path);
};

[[nodiscard]] std::string_view get_error_msg(LoadError code) noexcept;

/// In lỗi kèm vị trí `file:line:col` ra stderr
void report_error(const LoadStatus& status);

} // namespace cinder
