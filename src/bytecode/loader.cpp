#include <cinder/bytecode/loader.h>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <print>
#include <vector>

namespace cinder {

namespace {
    constexpr std::string_view COMMENT_CHARS = "#";
    constexpr std::string_view WHITESPACE = " \t\r\v\f";

    struct Token {
        std::string_view text;
        uint32_t col = 0;   // 1-based
    };

    // Tách dòng thành token theo khoảng trắng, bỏ phần comment
    std::vector<Token> split_line(std::string_view line) {
        if (size_t cut = line.find_first_of(COMMENT_CHARS); cut != std::string_view::npos) {
            line = line.substr(0, cut);
        }
        std::vector<Token> tokens;
        size_t pos = 0;
        while (true) {
            size_t start = line.find_first_not_of(WHITESPACE, pos);
            if (start == std::string_view::npos) break;
            size_t end = line.find_first_of(WHITESPACE, start);
            if (end == std::string_view::npos) end = line.size();
            tokens.push_back({line.substr(start, end - start), static_cast<uint32_t>(start + 1)});
            pos = end;
        }
        return tokens;
    }

    // Thập phân hoặc 0x hex, có thể có dấu
    bool parse_integer(std::string_view text, int64_t& out) {
        bool negative = false;
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        int base = 10;
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
            base = 16;
            text.remove_prefix(2);
        }
        if (text.empty()) return false;

        uint64_t magnitude = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude, base);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return false;

        constexpr uint64_t max_pos = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (negative) {
            if (magnitude > max_pos + 1) return false;
            out = static_cast<int64_t>(0 - magnitude);
        } else {
            if (magnitude > max_pos) return false;
            out = static_cast<int64_t>(magnitude);
        }
        return true;
    }

    bool operand_in_range(OperandKind kind, int64_t value) {
        switch (kind) {
            case OperandKind::IMM64:     return true;
            case OperandKind::REG8:      return value >= 0 && value <= 0xFF;
            case OperandKind::NATIVE_ID: return value >= 0 && value <= 0xFFFFFFFFLL;
            case OperandKind::TARGET:
            case OperandKind::OFFSET:    return value >= 0;
            case OperandKind::NONE:      return false;
        }
        return false;
    }
}

LoadResult TextLoader::parse(std::string_view source, std::string_view filename) {
    meow::Context ctx;
    ctx.load(filename);

    std::vector<Instruction> instructions;
    size_t memory_size = DEFAULT_MEMORY_SIZE;

    size_t line_start = 0;
    while (line_start <= source.size()) {
        size_t line_end = source.find('\n', line_start);
        if (line_end == std::string_view::npos) line_end = source.size();
        std::string_view line = source.substr(line_start, line_end - line_start);

        std::vector<Token> tokens = split_line(line);
        if (!tokens.empty()) {
            const Token& head = tokens[0];
            ctx.col = head.col;

            if (head.text.front() == '.') {
                // --- Directive ---
                if (head.text != ".memory") return ctx.error(LoadError::INVALID_DIRECTIVE);
                if (tokens.size() < 2) return ctx.error(LoadError::MISSING_OPERAND);
                ctx.col = tokens[1].col;
                int64_t value = 0;
                if (!parse_integer(tokens[1].text, value) || value <= 0) {
                    return ctx.error(LoadError::INVALID_OPERAND);
                }
                if (tokens.size() > 2) {
                    ctx.col = tokens[2].col;
                    return ctx.error(LoadError::UNEXPECTED_OPERAND);
                }
                memory_size = static_cast<size_t>(value);
            } else {
                // --- Instruction ---
                auto op = from_mnemonic(head.text);
                if (!op) return ctx.error(LoadError::UNKNOWN_OPCODE);

                OperandKind kind = get_op_info(*op).operand;
                Instruction inst{*op, 0};
                if (kind == OperandKind::NONE) {
                    if (tokens.size() > 1) {
                        ctx.col = tokens[1].col;
                        return ctx.error(LoadError::UNEXPECTED_OPERAND);
                    }
                } else {
                    if (tokens.size() < 2) return ctx.error(LoadError::MISSING_OPERAND);
                    std::string_view text = tokens[1].text;
                    ctx.col = tokens[1].col;
                    // Cho phép "r3" cho PUSH_REG
                    if (kind == OperandKind::REG8 && text.size() > 1 && (text[0] == 'r' || text[0] == 'R')) {
                        text.remove_prefix(1);
                    }
                    if (!parse_integer(text, inst.operand) || !operand_in_range(kind, inst.operand)) {
                        return ctx.error(LoadError::INVALID_OPERAND);
                    }
                    if (tokens.size() > 2) {
                        ctx.col = tokens[2].col;
                        return ctx.error(LoadError::UNEXPECTED_OPERAND);
                    }
                }
                instructions.push_back(inst);
            }
        }

        line_start = line_end + 1;
        ctx.advance_line();
    }

    return Program(std::move(instructions), memory_size);
}

LoadResult TextLoader::load_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) [[unlikely]] return LoadStatus::make(LoadError::FILE_OPEN_FAILED, 0xFFFF, 0, 0);

    auto size = f.tellg();
    std::string source;
    source.resize_and_overwrite(static_cast<size_t>(size), [&](char* buf, size_t n) {
        f.seekg(0);
        f.read(buf, static_cast<std::streamsize>(n));
        return static_cast<size_t>(f.gcount());
    });

    return parse(source, path);
}

std::string_view get_error_msg(LoadError code) noexcept {
    switch (code) {
        case LoadError::OK:                 return "OK";
        case LoadError::FILE_OPEN_FAILED:   return "Cannot open file";
        case LoadError::UNKNOWN_OPCODE:     return "Unknown opcode";
        case LoadError::MISSING_OPERAND:    return "Missing operand";
        case LoadError::INVALID_OPERAND:    return "Invalid or out-of-range operand";
        case LoadError::UNEXPECTED_OPERAND: return "Unexpected operand";
        case LoadError::INVALID_DIRECTIVE:  return "Unknown directive";
    }
    return "Unknown error";
}

void report_error(const LoadStatus& status) {
    if (status.code() == LoadError::FILE_OPEN_FAILED) {
        std::println(stderr, "[Loader] Error: {}", get_error_msg(status.code()));
    } else {
        std::println(stderr, "[Loader] Error at {}:{}:{}: {}",
            status.filename(), status.line(), status.col(), get_error_msg(status.code()));
    }
}

} // namespace cinder
