#pragma once

#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace TestHooks {

struct MoveHookInfo {
    std::string source;
    std::string destination;
};

// Runs inside MovableMediaFile::move_file after the source and destination checks,
// right before the rename. A returned error code fails the move without touching
// the disk; nullopt lets the real move proceed.
using MoveHook = std::function<std::optional<std::error_code>(const MoveHookInfo&)>;
void set_move_hook(MoveHook hook);
void reset_move_hook();
std::optional<std::error_code> run_move_hook(const MoveHookInfo& info);

} // namespace TestHooks
