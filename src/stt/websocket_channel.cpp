#include "stt/websocket_channel.hpp"
#include "audio/chunk_channel.hpp"
#include "core/errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

struct WebSocketChannel::Impl {
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    explicit Impl(Options opts) : options(std::move(opts)) {}

    template <class F>
    void visit(F&& f) {
        if (tls) f(*tls);
        else f(*plain);
    }

    void startRead() {
        visit([this](auto& ws) {
            ws.async_read(buffer, [this](beast::error_code ec, std::size_t bytes) { onRead(ec, bytes); });
        });
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != net::error::operation_aborted && !closed.load()) {
                std::lock_guard<std::mutex> lock(errorMutex);
                readError = ec.message();
            }
            incoming.close();
            return;
        }

        ChannelMessage message;
        visit([&](auto& ws) { message.binary = ws.got_binary(); });
        message.data = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        incoming.push(std::move(message));
        startRead();
    }

    template <class Stream>
    void handshake(Stream& ws, const Endpoint& endpoint) {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        const std::string userAgent = options.userAgent;
        ws.set_option(websocket::stream_base::decorator([userAgent](websocket::request_type& req) {
            req.set(http::field::user_agent, userAgent);
        }));

        websocket::response_type res;
        beast::error_code ec;
        ws.handshake(res, endpoint.host + ":" + endpoint.port, endpoint.target, ec);
        if (ec) {
            const unsigned status = res.result_int();
            if (status == 401 || status == 403) {
                throw AuthError("backend refused the connection (HTTP " + std::to_string(status) + ")");
            }
            throw ConnectionError("WebSocket handshake with " + endpoint.url() + ": " + ec.message());
        }
    }

    Options options;
    net::io_context ioc;
    ssl::context sslContext{ssl::context::tls_client};
    std::unique_ptr<PlainStream> plain;
    std::unique_ptr<TlsStream> tls;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread ioThread;

    beast::flat_buffer buffer;
    ChunkChannel<ChannelMessage> incoming{std::numeric_limits<size_t>::max(), OverflowPolicy::Block};

    std::mutex errorMutex;
    std::string readError;

    // io thread only
    bool writeInFlight = false;
    std::function<void()> deferredClose;

    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
};

// Constructor
WebSocketChannel::WebSocketChannel() : WebSocketChannel(Options()) {}

WebSocketChannel::WebSocketChannel(Options options) : impl_(std::make_unique<Impl>(std::move(options))) {}

// Destructor
WebSocketChannel::~WebSocketChannel() { close(); }

void WebSocketChannel::connect(const Endpoint& endpoint) {
    if (impl_->connected.load() || impl_->closed.load()) {
        throw std::logic_error("WebSocketChannel::connect called twice");
    }

    beast::error_code ec;
    tcp::resolver resolver(impl_->ioc);
    auto const results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) throw ConnectionError("resolve " + endpoint.host + ": " + ec.message());

    if (endpoint.secure) {
        impl_->sslContext.set_default_verify_paths(ec);
        if (ec) {
            std::cerr << "[Transport] [WARN] no default CA paths: " << ec.message() << "\n";
        }
        impl_->sslContext.set_verify_mode(impl_->options.verifyPeer ? ssl::verify_peer : ssl::verify_none);

        impl_->tls = std::make_unique<Impl::TlsStream>(impl_->ioc, impl_->sslContext);
        auto& tlsLayer = impl_->tls->next_layer();
        if (!SSL_set_tlsext_host_name(tlsLayer.native_handle(), endpoint.host.c_str())) {
            throw ConnectionError("TLS SNI setup failed for " + endpoint.host);
        }
        if (impl_->options.verifyPeer) {
            tlsLayer.set_verify_callback(ssl::host_name_verification(endpoint.host));
        }

        beast::get_lowest_layer(*impl_->tls).connect(results, ec);
        if (ec) throw ConnectionError("connect " + endpoint.url() + ": " + ec.message());

        tlsLayer.handshake(ssl::stream_base::client, ec);
        if (ec) throw ConnectionError("TLS handshake with " + endpoint.host + ": " + ec.message());

        impl_->handshake(*impl_->tls, endpoint);
    } else {
        impl_->plain = std::make_unique<Impl::PlainStream>(impl_->ioc);

        beast::get_lowest_layer(*impl_->plain).connect(results, ec);
        if (ec) throw ConnectionError("connect " + endpoint.url() + ": " + ec.message());

        impl_->handshake(*impl_->plain, endpoint);
    }

    impl_->work.emplace(net::make_work_guard(impl_->ioc));
    impl_->startRead();
    impl_->ioThread = std::thread([this] { impl_->ioc.run(); });
    impl_->connected.store(true);

    std::cout << "[Transport] [INFO] connected to " << endpoint.url() << "\n";
}

void WebSocketChannel::write(const ChannelMessage& message) {
    if (!impl_->connected.load() || impl_->closed.load()) {
        throw ConnectionError("channel is not open");
    }

    auto payload = std::make_shared<std::string>(message.data);
    auto done = std::make_shared<std::promise<beast::error_code>>();
    std::future<beast::error_code> result = done->get_future();
    const bool binary = message.binary;

    Impl* impl = impl_.get();
    net::post(impl->ioc, [impl, payload, done, binary]() {
        if (impl->closed.load()) {
            done->set_value(net::error::operation_aborted);
            return;
        }
        impl->writeInFlight = true;
        impl->visit([&](auto& ws) {
            ws.binary(binary);
            ws.async_write(net::buffer(*payload), [impl, payload, done](beast::error_code ec, std::size_t) {
                impl->writeInFlight = false;
                done->set_value(ec);
                if (impl->deferredClose) {
                    auto closeNow = std::move(impl->deferredClose);
                    impl->deferredClose = nullptr;
                    closeNow();
                }
            });
        });
    });

    while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (impl_->closed.load()) throw ConnectionError("channel closed while writing");
    }

    const beast::error_code ec = result.get();
    if (ec) throw ConnectionError("write: " + ec.message());
}

bool WebSocketChannel::read(ChannelMessage& message) {
    if (impl_->incoming.pop(message)) return true;

    std::lock_guard<std::mutex> lock(impl_->errorMutex);
    if (!impl_->readError.empty()) {
        const std::string error = impl_->readError;
        impl_->readError.clear();
        throw ConnectionError("connection lost: " + error);
    }
    return false;
}

void WebSocketChannel::close() {
    if (impl_->closed.exchange(true)) return;

    if (impl_->connected.load()) {
        auto done = std::make_shared<std::promise<void>>();
        std::future<void> closedFuture = done->get_future();

        Impl* impl = impl_.get();
        net::post(impl->ioc, [impl, done]() {
            auto closeNow = [impl, done]() {
                impl->visit([&](auto& ws) {
                    if (!ws.is_open()) {
                        done->set_value();
                        return;
                    }
                    ws.async_close(websocket::close_code::normal, [done](beast::error_code ec) {
                        if (ec) std::cout << "[Transport] [INFO] close handshake: " << ec.message() << "\n";
                        done->set_value();
                    });
                });
            };
            // Beast allows one write-side operation at a time
            if (impl->writeInFlight) impl->deferredClose = closeNow;
            else closeNow();
        });

        if (closedFuture.wait_for(std::chrono::milliseconds(impl_->options.closeTimeoutMs)) != std::future_status::ready) {
            std::cerr << "[Transport] [WARN] close handshake timed out\n";
        }

        impl_->work.reset();
        impl_->ioc.stop();
        if (impl_->ioThread.joinable()) impl_->ioThread.join();
    }

    impl_->incoming.close();
}
