#include "roomsync/core/transport/beast/websocket.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <variant>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "lcr/log/logger.hpp"


namespace roomsync::core::transport::beast {

namespace {

namespace asio  = boost::asio;
namespace ssl   = boost::asio::ssl;
namespace wsock = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

using plain_stream = wsock::stream<boost::beast::tcp_stream>;
using tls_stream   = wsock::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

// Upper bound for a graceful close handshake before the IO loop is stopped
constexpr auto CLOSE_TIMEOUT = std::chrono::seconds(2);

constexpr const char* USER_AGENT = "RoomSync/1.0";

// Maps an error observed on an established connection
[[nodiscard]]
Error to_error(const boost::system::error_code& ec) noexcept {
    if (!ec) {
        return Error::None;
    }
    if (ec == asio::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    if (ec == wsock::error::closed || ec == asio::error::eof || ec == asio::error::connection_reset
        || ec == ssl::error::stream_truncated) {
        return Error::RemoteClosed;
    }
    if (ec == boost::beast::error::timeout || ec == asio::error::timed_out) {
        return Error::Timeout;
    }
    if (ec == wsock::condition::protocol_violation) {
        return Error::ProtocolError;
    }
    return Error::TransportFailure;
}

} // namespace


// ============================================================================
// Impl
// ============================================================================

struct WebSocket::Impl {
    asio::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tls_client};
    std::variant<std::monostate, plain_stream, tls_stream> stream;

    // IO thread only
    boost::beast::flat_buffer buffer;
    std::deque<std::string> write_queue;

    std::thread io_thread;
    std::future<void> io_done;
    std::atomic<bool> open{false};
    std::atomic<bool> close_signaled{false};

    // IO thread → caller thread
    std::mutex mtx;
    std::deque<websocket::Event> events;
    std::deque<std::string> messages;

    void push_event(websocket::Event ev) {
        std::lock_guard<std::mutex> lock(mtx);
        events.push_back(ev);
    }

    // Close is always signaled exactly once
    void signal_close() {
        if (!close_signaled.exchange(true, std::memory_order_acq_rel)) {
            push_event(websocket::Event::make_close());
        }
    }

    void on_failure(const boost::system::error_code& ec) {
        open.store(false, std::memory_order_release);
        const Error err = to_error(ec);
        if (err != Error::LocalShutdown && !(ec == wsock::error::closed)) {
            RS_WARN("[WS] Transport failure: " << ec.message() << " (" << to_string(err) << ")");
            push_event(websocket::Event::make_error(err));
        }
        else {
            RS_DEBUG("[WS] Connection closed (" << ec.message() << ")");
        }
        signal_close();
    }

    template<class Stream>
    void do_read(Stream& ws) {
        ws.async_read(buffer, [this, &ws](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                on_failure(ec);
                return;
            }
            std::string msg = boost::beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            RS_TRACE("[WS] Received message (size " << msg.size() << ")");
            {
                std::lock_guard<std::mutex> lock(mtx);
                messages.push_back(std::move(msg));
            }
            do_read(ws);
        });
    }

    template<class Stream>
    void do_write(Stream& ws) {
        ws.async_write(asio::buffer(write_queue.front()), [this, &ws](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                RS_ERROR("[WS] Write failed: " << ec.message());
                write_queue.clear();
                if (open.exchange(false, std::memory_order_acq_rel)) {
                    push_event(websocket::Event::make_error(to_error(ec) == Error::LocalShutdown ? Error::LocalShutdown : Error::TransportFailure));
                }
                // Tear the socket down so the pending read completes and signals Close
                boost::system::error_code ignored;
                boost::beast::get_lowest_layer(ws).socket().close(ignored);
                return;
            }
            write_queue.pop_front();
            if (!write_queue.empty()) {
                do_write(ws);
            }
        });
    }

    template<class Stream>
    void handshake(Stream& ws, const std::string& host, const std::string& port, const std::string& path) {
        ws.set_option(wsock::stream_base::timeout::suggested(boost::beast::role_type::client));
        ws.set_option(wsock::stream_base::decorator([](wsock::request_type& req) {
            req.set(boost::beast::http::field::user_agent, USER_AGENT);
        }));
        ws.text(true);
        ws.handshake(host + ":" + port, path);
    }

    void start() {
        std::promise<void> done;
        io_done = done.get_future();
        std::visit([this](auto& ws) {
            using S = std::decay_t<decltype(ws)>;
            if constexpr (!std::is_same_v<S, std::monostate>) {
                do_read(ws);
            }
        }, stream);
        io_thread = std::thread([this, done = std::move(done)]() mutable {
            try {
                ioc.run();
            }
            catch (const std::exception& e) {
                RS_ERROR("[WS] IO loop terminated: " << e.what());
                open.store(false, std::memory_order_release);
                push_event(websocket::Event::make_error(Error::TransportFailure));
            }
            signal_close();
            done.set_value();
        });
    }
};


// ============================================================================
// WebSocket
// ============================================================================

WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{
}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path, bool secure) noexcept {
    if (impl_->io_thread.joinable() || !std::holds_alternative<std::monostate>(impl_->stream)) {
        RS_WARN("[WS] connect() called on a used transport instance");
        return Error::InvalidState;
    }
    // Failures before the socket is up are connection failures, after it handshake failures
    Error stage = Error::ConnectionFailed;
    try {
        tcp::resolver resolver{impl_->ioc};
        const auto results = resolver.resolve(host, port);
        if (secure) {
            impl_->ssl_ctx.set_default_verify_paths();
            impl_->ssl_ctx.set_verify_mode(ssl::verify_peer);
            auto& ws = impl_->stream.emplace<tls_stream>(impl_->ioc, impl_->ssl_ctx);
            boost::beast::get_lowest_layer(ws).connect(results);
            stage = Error::HandshakeFailed;
            if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
                RS_ERROR("[WS] Failed to set SNI host name '" << host << "'");
                return Error::HandshakeFailed;
            }
            ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
            ws.next_layer().handshake(ssl::stream_base::client);
            impl_->handshake(ws, host, port, path);
        }
        else {
            auto& ws = impl_->stream.emplace<plain_stream>(impl_->ioc);
            boost::beast::get_lowest_layer(ws).connect(results);
            stage = Error::HandshakeFailed;
            impl_->handshake(ws, host, port, path);
        }
    }
    catch (const boost::system::system_error& e) {
        RS_ERROR("[WS] Connect to " << host << ":" << port << path << " failed: " << e.code().message());
        impl_->stream.emplace<std::monostate>();
        return stage;
    }
    catch (const std::exception& e) {
        RS_ERROR("[WS] Connect to " << host << ":" << port << path << " failed: " << e.what());
        impl_->stream.emplace<std::monostate>();
        return Error::TransportFailure;
    }
    impl_->open.store(true, std::memory_order_release);
    try {
        impl_->start();
    }
    catch (const std::exception& e) {
        RS_ERROR("[WS] Failed to start IO thread: " << e.what());
        impl_->open.store(false, std::memory_order_release);
        return Error::TransportFailure;
    }
    RS_DEBUG("[WS] Connected to " << host << ":" << port << path);
    return Error::None;
}

bool WebSocket::send(std::string_view msg) noexcept {
    if (!impl_->open.load(std::memory_order_acquire)) {
        RS_WARN("[WS] send() called on a closed WebSocket");
        return false;
    }
    RS_TRACE("[WS] Sending message ... (size " << msg.size() << ")");
    try {
        Impl* impl = impl_.get();
        asio::post(impl->ioc, [impl, payload = std::string(msg)]() mutable {
            impl->write_queue.push_back(std::move(payload));
            if (impl->write_queue.size() > 1) {
                return; // a write is already in flight
            }
            std::visit([impl](auto& ws) {
                using S = std::decay_t<decltype(ws)>;
                if constexpr (!std::is_same_v<S, std::monostate>) {
                    impl->do_write(ws);
                }
            }, impl->stream);
        });
    }
    catch (const std::exception& e) {
        RS_ERROR("[WS] Failed to schedule write: " << e.what());
        return false;
    }
    return true;
}

void WebSocket::close() noexcept {
    if (!impl_) {
        return;
    }
    Impl* impl = impl_.get();
    if (impl->open.exchange(false, std::memory_order_acq_rel)) {
        RS_TRACE("[WS] Closing WebSocket ...");
        try {
            asio::post(impl->ioc, [impl]() {
                std::visit([](auto& ws) {
                    using S = std::decay_t<decltype(ws)>;
                    if constexpr (!std::is_same_v<S, std::monostate>) {
                        ws.async_close(wsock::close_code::normal, [](const boost::system::error_code& ec) {
                            if (ec) {
                                RS_DEBUG("[WS] Close handshake ended with: " << ec.message());
                            }
                        });
                    }
                }, impl->stream);
            });
        }
        catch (const std::exception& e) {
            RS_ERROR("[WS] Failed to schedule close: " << e.what());
            impl->ioc.stop();
        }
    }
    if (impl->io_thread.joinable()) {
        if (impl->io_done.wait_for(CLOSE_TIMEOUT) != std::future_status::ready) {
            RS_WARN("[WS] Close handshake timed out, stopping IO loop");
            impl->ioc.stop();
        }
        impl->io_thread.join();
    }
    impl->signal_close();
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->events.empty()) {
        return false;
    }
    out = impl_->events.front();
    impl_->events.pop_front();
    return true;
}

bool WebSocket::poll_message(std::string& out) noexcept {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->messages.empty()) {
        return false;
    }
    out = std::move(impl_->messages.front());
    impl_->messages.pop_front();
    return true;
}

} // namespace roomsync::core::transport::beast
