#include <cinder/errors.h>
#include <format>
#include <meow_enum.h>

namespace cinder {

std::string_view to_string(ValidationErrorKind kind) noexcept { return meow::enum_name(kind); }
std::string_view to_string(AllocationErrorKind kind) noexcept { return meow::enum_name(kind); }
std::string_view to_string(EmissionErrorKind kind) noexcept { return meow::enum_name(kind); }
std::string_view to_string(ExecError kind) noexcept { return meow::enum_name(kind); }

std::string describe(const ExecFault& fault) {
    if (fault.pc == ExecFault::UNKNOWN_PC) {
        return std::format("{} (in compiled code)", to_string(fault.kind));
    }
    return std::format("{} at instruction {}", to_string(fault.kind), fault.pc);
}

} // namespace cinder
