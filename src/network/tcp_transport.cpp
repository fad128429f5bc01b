#include "c19/transport.hpp"
#include "c19/logger.hpp"
#include "c19/metrics.hpp"
#include "c19/peer_provider.hpp"
#include <algorithm>

namespace c19 {

namespace {

// How often a waiting exchange checks on its attempt
constexpr std::chrono::milliseconds EXCHANGE_POLL{5};

}  // namespace

// Connection implementation

Connection::Connection(elio::net::tcp_stream stream)
    : stream_(std::move(stream))
{}

Connection::~Connection() = default;

elio::coro::task<Status> Connection::send(const protocol::Message& msg, uint32_t request_id) {
    ByteBuffer data;
    try {
        data = protocol::Codec::encode(msg, request_id);
    } catch (const std::exception& e) {
        co_return Status::error(ErrorCode::InvalidArgument, e.what());
    }

    co_await send_mutex_.lock();

    size_t sent = 0;
    while (sent < data.size()) {
        auto result = co_await stream_.write(data.data() + sent, data.size() - sent);
        if (result.result <= 0) {
            connected_ = false;
            send_mutex_.unlock();
            co_return Status::error(ErrorCode::NetworkError, "Failed to send message");
        }
        sent += result.result;
    }

    send_mutex_.unlock();
    metrics().messages_sent_total.inc();
    co_return Status::make_ok();
}

elio::coro::task<ExchangeResult> Connection::receive() {
    ExchangeResult out;
    co_await recv_mutex_.lock();

    // Read header first
    ByteBuffer frame(protocol::MessageHeader::SIZE);
    size_t header_read = 0;

    while (header_read < protocol::MessageHeader::SIZE) {
        auto result = co_await stream_.read(frame.data() + header_read,
                                            protocol::MessageHeader::SIZE - header_read);
        if (result.result <= 0) {
            connected_ = false;
            recv_mutex_.unlock();
            out.status = Status::error(ErrorCode::NetworkError, "Connection closed");
            co_return out;
        }
        header_read += result.result;
    }

    protocol::MessageHeader header;
    try {
        header = protocol::Codec::parse_header(frame);
    } catch (const std::exception& e) {
        recv_mutex_.unlock();
        out.status = Status::error(ErrorCode::MalformedMessage, e.what());
        co_return out;
    }
    out.request_id = header.request_id;

    // Read body
    frame.resize(protocol::MessageHeader::SIZE + header.length);
    size_t body_read = 0;

    while (body_read < header.length) {
        auto result = co_await stream_.read(frame.data() + protocol::MessageHeader::SIZE + body_read,
                                            header.length - body_read);
        if (result.result <= 0) {
            connected_ = false;
            recv_mutex_.unlock();
            out.status = Status::error(ErrorCode::NetworkError, "Connection closed mid-frame");
            co_return out;
        }
        body_read += result.result;
    }

    recv_mutex_.unlock();

    try {
        auto [msg, hdr] = protocol::Codec::decode(frame);
        metrics().messages_received_total.inc();
        out.response = std::move(msg);
    } catch (const std::exception& e) {
        out.status = Status::error(ErrorCode::MalformedMessage, e.what());
    }
    co_return out;
}

elio::coro::task<void> Connection::close() {
    if (connected_.exchange(false)) {
        co_await stream_.close();
    }
}

std::string Connection::peer_address() const {
    auto addr = stream_.peer_address();
    if (addr) {
        return addr->to_string();
    }
    return "unknown";
}

// TcpTransport implementation

TcpTransport::TcpTransport(const ConnectionConfig& config, elio::io::io_context& io_ctx)
    : config_(config)
    , io_ctx_(io_ctx)
{}

TcpTransport::~TcpTransport() = default;

elio::coro::task<Status> TcpTransport::start(elio::runtime::scheduler& sched,
                                             InboundHandler handler) {
    sched_ = &sched;
    handler_ = std::move(handler);

    elio::net::ipv4_address listen_addr(config_.bind_address, config_.port);

    auto listener_result = elio::net::tcp_listener::bind(listen_addr, io_ctx_);
    if (!listener_result) {
        co_return Status::error(ErrorCode::NetworkError,
            "Failed to bind gossip port " + std::to_string(config_.port));
    }

    listener_ = std::move(*listener_result);
    running_ = true;

    tasks_.fetch_add(1);
    auto accept_task = accept_loop();
    sched.spawn(accept_task.release());

    Logger::instance().info("Listening for gossip on " + config_.bind_address + ":" +
                            std::to_string(config_.port));
    co_return Status::make_ok();
}

elio::coro::task<void> TcpTransport::stop() {
    running_ = false;

    if (listener_) {
        listener_->close();
    }

    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard lock(inbound_mutex_);
        for (auto& weak : inbound_) {
            if (auto conn = weak.lock()) {
                open.push_back(std::move(conn));
            }
        }
        inbound_.clear();
    }
    for (auto& conn : open) {
        co_await conn->close();
    }

    auto deadline = Clock::now() + config_.timeout;
    while (tasks_.load() > 0 && Clock::now() < deadline) {
        co_await elio::time::sleep_for(io_ctx_, std::chrono::milliseconds(10));
    }
    if (auto left = tasks_.load(); left > 0) {
        Logger::instance().warning("Transport stopped with " + std::to_string(left) +
                                   " connection tasks still running");
    }
}

elio::coro::task<Status> TcpTransport::send(std::string peer, protocol::Message msg,
                                            std::chrono::milliseconds timeout) {
    auto result = co_await exchange(std::move(peer), std::move(msg), timeout, false);
    co_return result.status;
}

elio::coro::task<ExchangeResult> TcpTransport::request(std::string peer, protocol::Message msg,
                                                       std::chrono::milliseconds timeout) {
    co_return co_await exchange(std::move(peer), std::move(msg), timeout, true);
}

elio::coro::task<ExchangeResult> TcpTransport::exchange(std::string peer, protocol::Message msg,
                                                        std::chrono::milliseconds timeout,
                                                        bool expect_reply) {
    ExchangeResult result;

    auto addr = PeerAddress::parse(peer, config_.peer_port());
    if (!addr) {
        result.status = Status::error(ErrorCode::InvalidArgument, "Invalid peer address: " + peer);
        co_return result;
    }

    if (!sched_) {
        result.status = Status::error(ErrorCode::InternalError, "Transport not started");
        co_return result;
    }

    if (!connecting_->claim(addr->to_string())) {
        result.status = Status::error(ErrorCode::Timeout,
            "Connect to " + peer + " still pending from an earlier exchange");
        co_return result;
    }

    auto ex = std::make_shared<Exchange>();
    auto task = attempt(ex, io_ctx_, connecting_, *addr, std::move(msg),
                        next_request_id_.fetch_add(1), expect_reply);
    sched_->spawn(task.release());

    auto deadline = Clock::now() + timeout;
    while (!ex->done.load()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) {
            break;
        }
        co_await elio::time::sleep_for(io_ctx_, std::min(left, EXCHANGE_POLL));
    }

    if (!ex->finished.exchange(true)) {
        std::shared_ptr<Connection> conn;
        {
            std::lock_guard lock(ex->mutex);
            conn = ex->conn;
        }
        if (conn) {
            co_await conn->close();
        }
        result.status = Status::error(ErrorCode::Timeout,
            "No answer from " + peer + " within " + std::to_string(timeout.count()) + "ms");
        co_return result;
    }

    // The attempt settled first; `done` follows without suspending
    while (!ex->done.load()) {
        co_await elio::time::sleep_for(io_ctx_, std::chrono::milliseconds(1));
    }
    {
        std::lock_guard lock(ex->mutex);
        result = std::move(ex->result);
    }
    co_return result;
}

elio::coro::task<void> TcpTransport::attempt(std::shared_ptr<Exchange> ex,
                                             elio::io::io_context& io_ctx,
                                             std::shared_ptr<PendingConnects> pending,
                                             PeerAddress addr, protocol::Message msg,
                                             uint32_t request_id, bool expect_reply) {
    ExchangeResult result;
    auto peer = addr.to_string();

    elio::net::ipv4_address target(addr.host, addr.port);
    auto stream = co_await elio::net::tcp_connect(io_ctx, target);
    pending->release(peer);

    if (!stream) {
        result.status = Status::error(ErrorCode::PeerUnreachable, "Failed to connect to " + peer);
        settle(*ex, std::move(result));
        co_return;
    }

    auto conn = std::make_shared<Connection>(std::move(*stream));
    bool late = false;
    {
        std::lock_guard lock(ex->mutex);
        if (ex->finished.load()) {
            late = true;
        } else {
            ex->conn = conn;
        }
    }
    if (late) {
        co_await conn->close();
        ex->done = true;
        co_return;
    }

    auto status = co_await conn->send(msg, request_id);
    if (status && expect_reply) {
        auto reply = co_await conn->receive();
        status = reply.status;
        if (status && reply.request_id != request_id) {
            status = Status::error(ErrorCode::MalformedMessage,
                "Reply from " + peer + " carries request id " +
                std::to_string(reply.request_id) + ", expected " + std::to_string(request_id));
        }
        if (status) {
            result.response = std::move(reply.response);
        }
    }
    co_await conn->close();

    result.status = status;
    settle(*ex, std::move(result));
}

void TcpTransport::settle(Exchange& ex, ExchangeResult result) {
    if (!ex.finished.exchange(true)) {
        std::lock_guard lock(ex.mutex);
        ex.result = std::move(result);
    }
    ex.done = true;
}

bool TcpTransport::PendingConnects::claim(const std::string& peer) {
    std::lock_guard lock(mutex);
    return peers.insert(peer).second;
}

void TcpTransport::PendingConnects::release(const std::string& peer) {
    std::lock_guard lock(mutex);
    peers.erase(peer);
}

elio::coro::task<void> TcpTransport::accept_loop() {
    CountGuard guard{tasks_};

    while (running_ && listener_) {
        auto stream_result = co_await listener_->accept();
        if (!stream_result) {
            if (running_) {
                Logger::instance().debug("Accept failed, retrying");
            }
            continue;
        }

        auto conn = std::make_shared<Connection>(std::move(*stream_result));
        if (!running_) {
            co_await conn->close();
            break;
        }

        {
            std::lock_guard lock(inbound_mutex_);
            inbound_.erase(std::remove_if(inbound_.begin(), inbound_.end(),
                                          [](const auto& weak) { return weak.expired(); }),
                           inbound_.end());
            inbound_.push_back(conn);
        }

        if (sched_) {
            tasks_.fetch_add(1);
            auto handler = handle_connection(conn);
            sched_->spawn(handler.release());
        }
    }
}

elio::coro::task<void> TcpTransport::handle_connection(std::shared_ptr<Connection> conn) {
    CountGuard guard{tasks_};

    while (running_ && conn->is_connected()) {
        auto received = co_await conn->receive();
        if (!received.status) {
            if (received.status.code() == ErrorCode::MalformedMessage) {
                metrics().malformed_messages_total.inc();
                Logger::instance().warning("Dropping malformed message from " +
                                           conn->peer_address() + ": " +
                                           received.status.message());

                protocol::ErrorMessage err;
                err.code = ErrorCode::MalformedMessage;
                err.message = received.status.message();
                err.original_request_id = received.request_id;
                auto status = co_await conn->send(protocol::Message{std::move(err)},
                                                  received.request_id);
                if (!status) {
                    Logger::instance().debug("Could not report error to " + conn->peer_address());
                }
            }
            break;
        }

        std::optional<protocol::Message> reply;
        if (handler_) {
            reply = handler_(*received.response);
        }

        if (reply) {
            auto status = co_await conn->send(*reply, received.request_id);
            if (!status) {
                Logger::instance().debug("Failed to reply to " + conn->peer_address() +
                                         ": " + status.to_string());
                break;
            }
        }
    }

    co_await conn->close();
}

}  // namespace c19
