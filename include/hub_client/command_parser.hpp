#ifndef HUB_CLIENT_COMMAND_PARSER_HPP
#define HUB_CLIENT_COMMAND_PARSER_HPP

#include "hub_client/operation.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hub_client {

struct EmptyLine {};

struct Quit {};

struct Dispatch {
    OperationKind operation;
};

/**
 * 无法识别的输入。subcommand 为 true 表示命令形状正确但区分操作的字面量无效（如 "send foo bob"）。
 */
struct Unrecognized {
    std::string text;
    bool subcommand = false;
};

using ParsedCommand = std::variant<EmptyLine, Quit, Dispatch, Unrecognized>;

std::vector<std::string> tokenize(std::string_view line);

/**
 * 把一行输入解析为命令。
 *
 *   broadcast
 *   send user <id> | send group <name>
 *   add <group> <user> | remove <group> <user>   (动词大小写不敏感)
 *   Q | Quite
 */
ParsedCommand parse_command(std::string_view line);

} // namespace hub_client

#endif // HUB_CLIENT_COMMAND_PARSER_HPP
