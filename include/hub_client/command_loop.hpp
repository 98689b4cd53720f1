#ifndef HUB_CLIENT_COMMAND_LOOP_HPP
#define HUB_CLIENT_COMMAND_LOOP_HPP

#include "hub_client/access_token.hpp"
#include "hub_client/dispatcher.hpp"
#include "hub_client/hub_endpoint.hpp"
#include "hub_client/request_builder.hpp"

#include <iosfwd>
#include <string>

namespace hub_client {

enum class LoopState { Running, Terminated };

/**
 * 交互式命令循环：逐行读取、解析、发送，每条命令处理完毕后才读取下一行。
 */
class CommandLoop {
public:
    CommandLoop(std::istream& in,
                std::ostream& out,
                HubEndpoint endpoint,
                SenderIdentity identity,
                TokenProvider token_provider,
                Dispatcher& dispatcher);

    /// 打印用法后循环直到收到退出命令或输入流结束。
    void run();

    /// 处理一行输入，返回处理后的状态。
    LoopState step(const std::string& line);

    LoopState state() const { return state_; }

    void show_help();

private:
    std::istream& in_;
    std::ostream& out_;
    const HubEndpoint endpoint_;
    const SenderIdentity identity_;
    TokenProvider token_provider_;
    Dispatcher& dispatcher_;
    LoopState state_ = LoopState::Running;
};

} // namespace hub_client

#endif // HUB_CLIENT_COMMAND_LOOP_HPP
