#include "hub_client/command_parser.hpp"

#include "hub_client/string_utils.hpp"

#include <cctype>

namespace hub_client {

std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        std::size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > start) tokens.emplace_back(line.substr(start, i - start));
    }
    return tokens;
}

ParsedCommand parse_command(std::string_view line) {
    auto const args = tokenize(line);
    if (args.empty()) {
        return EmptyLine{};
    }

    auto const& verb = args[0];

    if (args.size() == 1) {
        // 退出关键字 "Quite" 保持原样，已有脚本依赖它
        if (verb == "Q" || verb == "Quite") return Quit{};
        if (verb == "broadcast") return Dispatch{Broadcast{}};
    } else if (args.size() == 3) {
        if (verb == "send") {
            if (args[1] == "user") return Dispatch{SendToUser{args[2]}};
            if (args[1] == "group") return Dispatch{SendToGroup{args[2]}};
            return Unrecognized{args[1], true};
        }
        if (iequals(verb, "add")) return Dispatch{AddToGroup{args[1], args[2]}};
        if (iequals(verb, "remove")) return Dispatch{RemoveFromGroup{args[1], args[2]}};
    }

    return Unrecognized{std::string(line), false};
}

} // namespace hub_client
