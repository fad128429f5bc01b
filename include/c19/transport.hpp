#pragma once

#include "types.hpp"
#include "config.hpp"
#include "protocol.hpp"
#include "peer_provider.hpp"
#include "timer.hpp"
#include <elio/coro/task.hpp>
#include <elio/sync/primitives.hpp>
#include <elio/runtime/scheduler.hpp>
#include <elio/io/io_context.hpp>
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace c19 {

// Outcome of one exchange with a peer
struct ExchangeResult {
    Status status;
    std::optional<protocol::Message> response;
    uint32_t request_id = 0;  // Of the received frame, once its header parsed
};

// Handles a message received from a peer, optionally producing a reply
using InboundHandler = std::function<std::optional<protocol::Message>(const protocol::Message&)>;

// Moves gossip messages between nodes. Every send/request completes within
// the given timeout; a response arriving later is discarded.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual elio::coro::task<Status> start(elio::runtime::scheduler& sched,
                                           InboundHandler handler) = 0;
    virtual elio::coro::task<void> stop() = 0;

    // One-way delivery
    virtual elio::coro::task<Status> send(std::string peer, protocol::Message msg,
                                          std::chrono::milliseconds timeout) = 0;

    // Request and wait for the peer's reply
    virtual elio::coro::task<ExchangeResult> request(std::string peer, protocol::Message msg,
                                                     std::chrono::milliseconds timeout) = 0;
};

// Connection to a remote node using Elio TCP
class Connection : public std::enable_shared_from_this<Connection> {
public:
    explicit Connection(elio::net::tcp_stream stream);
    ~Connection();

    elio::coro::task<Status> send(const protocol::Message& msg, uint32_t request_id = 0);

    // Reads one frame. Closed streams give NetworkError, undecodable frames
    // MalformedMessage.
    elio::coro::task<ExchangeResult> receive();

    bool is_connected() const { return connected_; }

    elio::coro::task<void> close();

    std::string peer_address() const;

private:
    elio::net::tcp_stream stream_;
    std::atomic<bool> connected_{true};
    elio::sync::mutex send_mutex_;
    elio::sync::mutex recv_mutex_;
};

// Connect-per-exchange TCP transport with a listener for inbound gossip.
//
// Each exchange runs as a detached attempt that owns everything it touches;
// the caller gives up at the deadline and closes the attempt's connection.
// A connect still pending past its deadline keeps the peer's slot, so later
// exchanges to that peer fail fast instead of piling up sockets.
class TcpTransport : public ITransport {
public:
    TcpTransport(const ConnectionConfig& config, elio::io::io_context& io_ctx);
    ~TcpTransport() override;

    elio::coro::task<Status> start(elio::runtime::scheduler& sched,
                                   InboundHandler handler) override;
    elio::coro::task<void> stop() override;

    elio::coro::task<Status> send(std::string peer, protocol::Message msg,
                                  std::chrono::milliseconds timeout) override;
    elio::coro::task<ExchangeResult> request(std::string peer, protocol::Message msg,
                                             std::chrono::milliseconds timeout) override;

private:
    // Shared between an exchange and its attempt. Whoever sets `finished`
    // first decides the outcome; `done` is set once the attempt has settled.
    struct Exchange {
        std::atomic<bool> finished{false};
        std::atomic<bool> done{false};
        std::mutex mutex;
        std::shared_ptr<Connection> conn;
        ExchangeResult result;
    };

    // Peers with a connect in progress
    struct PendingConnects {
        std::mutex mutex;
        std::unordered_set<std::string> peers;

        bool claim(const std::string& peer);
        void release(const std::string& peer);
    };

    ConnectionConfig config_;
    elio::io::io_context& io_ctx_;
    elio::runtime::scheduler* sched_ = nullptr;
    InboundHandler handler_;

    std::optional<elio::net::tcp_listener> listener_;
    std::atomic<bool> running_{false};
    std::atomic<uint32_t> next_request_id_{1};
    std::shared_ptr<PendingConnects> connecting_ = std::make_shared<PendingConnects>();

    // Accept loop and inbound handlers still running, and their connections
    std::atomic<size_t> tasks_{0};
    std::mutex inbound_mutex_;
    std::vector<std::weak_ptr<Connection>> inbound_;

    elio::coro::task<ExchangeResult> exchange(std::string peer, protocol::Message msg,
                                              std::chrono::milliseconds timeout,
                                              bool expect_reply);
    static elio::coro::task<void> attempt(std::shared_ptr<Exchange> ex,
                                         elio::io::io_context& io_ctx,
                                         std::shared_ptr<PendingConnects> pending,
                                         PeerAddress addr, protocol::Message msg,
                                         uint32_t request_id, bool expect_reply);
    static void settle(Exchange& ex, ExchangeResult result);
    elio::coro::task<void> accept_loop();
    elio::coro::task<void> handle_connection(std::shared_ptr<Connection> conn);
};

}  // namespace c19
