#include <cinder/sandbox/stack_analysis.h>
#include <cinder/errors.h>
#include <cinder/vm/limits.h>
#include <algorithm>
#include <format>

namespace cinder {

namespace {
    // Worklist phân tích khoảng chiều cao stack trên CFG.
    // min chỉ giảm (chặn dưới bởi underflow), max chỉ tăng (chặn trên bởi MAX_STACK_DEPTH) => luôn dừng.
    class HeightPropagator {
    public:
        explicit HeightPropagator(const Program& program) : program_(program) {
            layout_.entry.assign(program.size(), HeightRange{});
        }

        StackLayout run() {
            flow_into(0, {0, 0});
            while (!worklist_.empty()) {
                size_t index = worklist_.back();
                worklist_.pop_back();
                visit(index);
            }
            return std::move(layout_);
        }

    private:
        const Program& program_;
        StackLayout layout_;
        std::vector<size_t> worklist_;

        void visit(size_t index) {
            const Instruction& inst = program_[index];
            const OpInfo info = get_op_info(inst.op);
            const HeightRange height = layout_.entry[index];

            if (height.min < info.pops) {
                throw ValidationError(ValidationErrorKind::StackUnderflow, index,
                    std::format("Stack underflow at instruction {}: {} needs {} operand(s), stack may hold {}",
                                index, mnemonic(inst.op), info.pops, height.min));
            }

            const int32_t delta = info.pushes - info.pops;
            const HeightRange after{height.min + delta, height.max + delta};
            if (static_cast<size_t>(after.max) > MAX_STACK_DEPTH) {
                throw ValidationError(ValidationErrorKind::StackOverflow, index,
                    std::format("Stack overflow at instruction {}: depth {} exceeds limit {}",
                                index, after.max, MAX_STACK_DEPTH));
            }
            layout_.max_depth = std::max(layout_.max_depth, after.max);

            if (is_branch(inst.op)) {
                if (inst.operand < 0 || inst.target() >= program_.size()) {
                    throw ValidationError(ValidationErrorKind::OutOfBoundsJump, index,
                        std::format("Invalid jump at instruction {}: target {} exceeds bounds", index, inst.operand));
                }
                flow_into(inst.target(), after);
            }
            if (!is_terminator(inst.op)) {
                flow_into(index + 1, after);
            }
        }

        // Hợp khoảng mới vào điểm đích, chỉ thăm lại khi khoảng mở rộng
        void flow_into(size_t target, HeightRange incoming) {
            HeightRange& slot = target == program_.size() ? layout_.exit : layout_.entry[target];
            const HeightRange merged = slot.reachable()
                ? HeightRange{std::min(slot.min, incoming.min), std::max(slot.max, incoming.max)}
                : incoming;
            if (merged == slot) return;

            slot = merged;
            layout_.max_depth = std::max(layout_.max_depth, merged.max);
            if (target < program_.size()) worklist_.push_back(target);
        }
    };
}

StackLayout analyze_stack(const Program& program) {
    return HeightPropagator(program).run();
}

} // namespace cinder
