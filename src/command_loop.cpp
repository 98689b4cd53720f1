#include "hub_client/command_loop.hpp"
#include "hub_client/command_parser.hpp"

#include <exception>
#include <iostream>

namespace hub_client {

CommandLoop::CommandLoop(std::istream& in,
                         std::ostream& out,
                         HubEndpoint endpoint,
                         SenderIdentity identity,
                         TokenProvider token_provider,
                         Dispatcher& dispatcher)
    : in_(in),
      out_(out),
      endpoint_(std::move(endpoint)),
      identity_(std::move(identity)),
      token_provider_(std::move(token_provider)),
      dispatcher_(dispatcher) {}

void CommandLoop::run() {
    show_help();
    std::string line;
    while (state_ == LoopState::Running) {
        if (!std::getline(in_, line)) {
            // 输入流关闭视为正常退出
            state_ = LoopState::Terminated;
            break;
        }
        step(line);
    }
}

LoopState CommandLoop::step(const std::string& line) {
    auto const command = parse_command(line);

    if (std::holds_alternative<Quit>(command)) {
        state_ = LoopState::Terminated;
    } else if (auto const* unknown = std::get_if<Unrecognized>(&command)) {
        out_ << "Can't recognize command " << unknown->text << std::endl;
    } else if (auto const* dispatch = std::get_if<Dispatch>(&command)) {
        // 单条命令的失败（如无法编码的ID）只报告，不结束循环
        try {
            auto const request = build_request(dispatch->operation, endpoint_.base_hub_path(), identity_, token_provider_);
            auto const outcome = dispatcher_.dispatch(request);
            if (!outcome.ok()) {
                out_ << describe(outcome) << std::endl;
            }
        } catch (const std::exception& e) {
            out_ << "Sent error: " << e.what() << std::endl;
        }
    }
    return state_;
}

void CommandLoop::show_help() {
    out_ << "*********Usage*********\n"
         << "send user <User Id>\n"
         << "send group <Group Name>\n"
         << "broadcast\n"
         << "add <Group Name> <User Id>\n"
         << "remove <Group Name> <User Id>\n"
         << "Q | Quite\n"
         << "***********************" << std::endl;
}

} // namespace hub_client
