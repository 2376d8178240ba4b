#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace surge::control {

struct GetStatus {};
struct GetStats {};
struct SetZThreshold { double value; };
struct SetVolumeRatio { double value; };
struct SetCooldown { int value; };
struct SetWhaleThreshold { double value; };
struct Pause {};
struct Resume {};
struct Help {};
struct SendTest {};

/// Known Set* command whose numeric argument did not parse
struct InvalidArgument {
    std::string usage;  // e.g. "/z 3.5"
};

/// Anything else; ignored without a reply
struct Unrecognized {};

/// One parsed operator command
using Command = std::variant<
    GetStatus,
    GetStats,
    SetZThreshold,
    SetVolumeRatio,
    SetCooldown,
    SetWhaleThreshold,
    Pause,
    Resume,
    Help,
    SendTest,
    InvalidArgument,
    Unrecognized
>;

/// Parser for operator text commands
///
/// Commands are case-insensitive and surrounding whitespace is ignored.
/// A "@botname" suffix on the command word (group chats) is stripped.
class CommandParser {
public:
    [[nodiscard]] static Command parse(std::string_view text);

    /// Strict decimal parse: the whole token must be a finite number
    [[nodiscard]] static bool parse_double(std::string_view token, double& out);

    /// Strict integer parse: no fraction, no trailing characters
    [[nodiscard]] static bool parse_int(std::string_view token, int& out);
};

/// Helper to get command name for logging
[[nodiscard]] std::string_view command_name(const Command& command);

}  // namespace surge::control
