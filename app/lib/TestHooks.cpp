#include "TestHooks.hpp"

#include <utility>

namespace {

TestHooks::MoveHook& move_hook_slot() {
    static TestHooks::MoveHook hook;
    return hook;
}

} // namespace

namespace TestHooks {

void set_move_hook(MoveHook hook) {
    move_hook_slot() = std::move(hook);
}

void reset_move_hook() {
    move_hook_slot() = MoveHook{};
}

std::optional<std::error_code> run_move_hook(const MoveHookInfo& info) {
    if (auto& hook = move_hook_slot()) {
        return hook(info);
    }
    return std::nullopt;
}

} // namespace TestHooks
