#include <filesystem>
#include <print>
#include <vector>
#include <string>
#include <string_view>
#include <charconv>

#include <cinder/config.h>
#include <cinder/errors.h>
#include <cinder/bytecode/disassemble.h>
#include <cinder/bytecode/loader.h>
#include <cinder/jit/jit_compiler.h>
#include <cinder/vm/interpreter.h>

namespace fs = std::filesystem;
using namespace cinder;

void print_usage() {
    std::println(stderr, "Usage: cinder [options] <command> <file>");
    std::println(stderr, "Commands:");
    std::println(stderr, "  exec              Validate, JIT-compile and run natively");
    std::println(stderr, "  debug             Run through the reference interpreter");
    std::println(stderr, "  disasm            Print bytecode listing and generated machine code");
    std::println(stderr, "Options:");
    std::println(stderr, "  -a, --allow-native <id>   Whitelist an extra native function id (repeatable)");
    std::println(stderr, "  -v, --version             Show version info");
    std::println(stderr, "  -h, --help                Show this help message");
}

enum class Command {
    Exec,
    Debug,
    Disasm,
    Unknown
};

static Command parse_command(std::string_view name) {
    if (name == "exec") return Command::Exec;
    if (name == "debug") return Command::Debug;
    if (name == "disasm" || name == "disassemble") return Command::Disasm;
    return Command::Unknown;
}

static bool parse_native_id(std::string_view text, uint32_t& out) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out, base);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

static void report_fault(const ExecFault& fault) {
    std::println(stderr, "Execution Error: {}", describe(fault));
}

static int run_exec(Program program, const std::vector<uint32_t>& extra_natives) {
    jit::JitCompiler compiler(std::move(program));
    for (uint32_t id : extra_natives) compiler.allow_native(id);

    jit::FinalizedCode code = compiler.compile();
    auto result = code.invoke();
    if (!result) {
        report_fault(result.error());
        return 1;
    }
    std::println("Result: {}", *result);
    return 0;
}

// Interpreter tự kiểm tra từng lệnh lúc chạy, không cần qua Sandbox
static int run_debug(Program program, const std::vector<uint32_t>& extra_natives) {
    Interpreter interpreter(std::move(program));
    for (uint32_t id : extra_natives) interpreter.allow_native(id);

    auto result = interpreter.execute();
    if (!result) {
        report_fault(result.error());
        return 1;
    }
    std::println("Result: {}", *result);
    return 0;
}

static int run_disasm(Program program, const std::vector<uint32_t>& extra_natives) {
    std::println("=== Bytecode ({} instructions) ===", program.size());
    std::print("{}", disassemble(program));

    jit::JitCompiler compiler(std::move(program));
    for (uint32_t id : extra_natives) compiler.allow_native(id);
    jit::FinalizedCode code = compiler.compile();

    std::println("=== Machine code ({} bytes) ===", code.bytes().size());
    std::print("{}", hex_dump(code.bytes()));
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.push_back(argv[i]);

    std::vector<uint32_t> extra_natives;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--version" || arg == "-v") {
            std::println("CinderVM v{}", CINDER_VERSION_STR);
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--allow-native" || arg == "-a") {
            uint32_t id = 0;
            if (i + 1 >= args.size() || !parse_native_id(args[i + 1], id)) {
                std::println(stderr, "Error: '{}' expects a native function id.", arg);
                return 1;
            }
            extra_natives.push_back(id);
            ++i;
            continue;
        }
        positional.push_back(arg);
    }

    if (positional.size() != 2) {
        print_usage();
        return 1;
    }

    Command command = parse_command(positional[0]);
    if (command == Command::Unknown) {
        std::println(stderr, "Error: Unknown command '{}'.", positional[0]);
        print_usage();
        return 1;
    }

    const std::string& input_file = positional[1];
    if (!fs::exists(input_file)) {
        std::println(stderr, "Error: File '{}' not found.", input_file);
        return 1;
    }

    auto loaded = TextLoader::load_file(input_file);
    if (loaded.failed()) {
        report_error(loaded.error());
        return 1;
    }
    Program program = std::move(loaded.value());

    try {
        switch (command) {
            case Command::Exec:   return run_exec(std::move(program), extra_natives);
            case Command::Debug:  return run_debug(std::move(program), extra_natives);
            case Command::Disasm: return run_disasm(std::move(program), extra_natives);
            case Command::Unknown: break;
        }
    } catch (const ValidationError& e) {
        std::println(stderr, "[Sandbox] {}: {}", to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        std::println(stderr, "[JIT] Error: {}", e.what());
        return 1;
    }

    return 1;
}
