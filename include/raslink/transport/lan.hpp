#pragma once

#include <raslink/config.hpp>
#include <raslink/crypto/codec.hpp>
#include <raslink/endpoint.hpp>
#include <raslink/transport.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <net/if.h>
#include <sys/socket.h>
#include <thread>

namespace raslink {
    namespace lan {

        namespace beast = boost::beast;
        namespace websocket = boost::beast::websocket;
        namespace net = boost::asio;
        using tcp = boost::asio::ip::tcp;

        /// Auth frame, first binary message after the upgrade, big-endian:
        ///   [id_len:4][device_id:id_len][timestamp_s:8][hmac:32]
        /// hmac = HMAC-SHA256(derive_key(secret, "auth"), device_id || timestamp_s)
        /// Verdict: one binary message, [0x01] = authenticated
        constexpr dp::u8 AUTH_SUCCESS = 0x01;

        inline dp::String ws_path(const dp::String &device_id) { return dp::String("/ws/") + device_id; }

        inline dp::Res<Message> sign_auth(const Message &master_secret, const dp::String &device_id,
                                          dp::u64 timestamp_s) {
            auto key_res = crypto::derive_key(master_secret, crypto::PURPOSE_AUTH);
            if (key_res.is_err()) {
                return key_res;
            }
            Message key = std::move(key_res.value());
            Message input = to_bytes(device_id);
            append_u64_be(input, timestamp_s);
            auto mac_res = crypto::hmac_sha256(key, input);
            secure_zero(key);
            return mac_res;
        }

        inline dp::Res<Message> encode_auth(const Message &master_secret, const dp::String &device_id,
                                            dp::u64 timestamp_s) {
            auto mac_res = sign_auth(master_secret, device_id, timestamp_s);
            if (mac_res.is_err()) {
                return mac_res;
            }
            Message frame;
            append_u32_be(frame, static_cast<dp::u32>(device_id.size()));
            append_string(frame, device_id);
            append_u64_be(frame, timestamp_s);
            const Message &mac = mac_res.value();
            frame.insert(frame.end(), mac.begin(), mac.end());
            return dp::result::ok(std::move(frame));
        }

        inline dp::Error from_system_error(const boost::system::system_error &e) {
            if (e.code() == beast::error::timeout) {
                return dp::Error::timeout(dp::String(e.what()));
            }
            if (e.code() == websocket::error::closed || e.code() == net::error::eof ||
                e.code() == net::error::connection_reset) {
                return dp::Error::not_found(dp::String(e.what()));
            }
            return dp::Error::io_error(dp::String(e.what()));
        }

    } // namespace lan

    // WebSocket link to the daemon on the local network
    // All socket work runs on a private io_context thread; callers block on futures
    class LanTransport : public Transport {
      private:
        lan::net::io_context ioc_;
        lan::net::executor_work_guard<lan::net::io_context::executor_type> work_;
        lan::websocket::stream<lan::beast::tcp_stream> ws_;
        std::thread io_thread_;
        LanEndpoint endpoint_;

        std::atomic<bool> closed_;
        std::atomic<bool> io_running_;
        std::mutex send_mutex_;

        std::mutex inbox_mutex_;
        std::condition_variable inbox_cv_;
        std::deque<Message> inbox_;
        bool read_failed_;
        lan::beast::flat_buffer read_buffer_;

        TransportStats stats_;

        explicit LanTransport(const LanEndpoint &endpoint)
            : work_(lan::net::make_work_guard(ioc_)), ws_(lan::net::make_strand(ioc_)), endpoint_(endpoint),
              closed_(false), io_running_(true), read_failed_(false) {
            io_thread_ = std::thread([this]() {
                echo::trace("lan io thread started");
                ioc_.run();
                io_running_ = false;
                echo::trace("lan io thread stopped");
            });
        }

        // Bind the socket to a named interface so traffic bypasses an active VPN route
        // Returns false when the platform refuses; the default route is used then
        bool bind_to_interface(const dp::String &interface_name) {
            auto &socket = lan::beast::get_lowest_layer(ws_).socket();
            boost::system::error_code ec;
            socket.open(lan::tcp::v4(), ec);
            if (ec) {
                echo::warn("lan: socket open failed: ", ec.message().c_str());
                return false;
            }
            if (::setsockopt(socket.native_handle(), SOL_SOCKET, SO_BINDTODEVICE, interface_name.c_str(),
                             static_cast<socklen_t>(interface_name.size())) < 0) {
                echo::warn("lan: cannot bind to ", interface_name.c_str(), " (", strerror(errno),
                           "), using default route");
                return false;
            }
            echo::debug("lan: socket bound to ", interface_name.c_str());
            return true;
        }

        dp::Res<void> open(const dp::String &device_id, const Message &master_secret, const Config &config) {
            namespace net = lan::net;
            namespace beast = lan::beast;
            namespace websocket = lan::websocket;

            try {
                lan::tcp::resolver resolver(ioc_);
                auto results = resolver
                                   .async_resolve(endpoint_.host.c_str(), std::to_string(endpoint_.port),
                                                  net::use_future)
                                   .get();
                lan::tcp::endpoint target;
                bool found = false;
                for (const auto &entry : results) {
                    if (entry.endpoint().address().is_v4()) {
                        target = entry.endpoint();
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    return dp::result::err(dp::Error::not_found("daemon address did not resolve"));
                }

                if (!endpoint_.interface_name.empty()) {
                    bind_to_interface(endpoint_.interface_name);
                }

                auto &stream = beast::get_lowest_layer(ws_);
                stream.expires_after(std::chrono::milliseconds(config.lan_connect_timeout_ms));
                stream.async_connect(target, net::use_future).get();
                echo::debug("lan: tcp connected to ", endpoint_.to_string());

                ws_.set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
                    req.set(beast::http::field::user_agent, "raslink");
                }));
                ws_.async_handshake(std::string(endpoint_.host.c_str()) + ":" + std::to_string(endpoint_.port),
                                    lan::ws_path(device_id).c_str(), net::use_future)
                    .get();
                ws_.binary(true);
                echo::debug("lan: websocket upgraded");

                auto auth_res = lan::encode_auth(master_secret, device_id, wall_now_ms() / 1000);
                if (auth_res.is_err()) {
                    return dp::result::err(auth_res.error());
                }
                const Message &auth = auth_res.value();
                stream.expires_after(std::chrono::milliseconds(config.lan_auth_timeout_ms));
                ws_.async_write(net::buffer(auth.data(), auth.size()), net::use_future).get();

                beast::flat_buffer verdict;
                ws_.async_read(verdict, net::use_future).get();
                const auto *bytes = static_cast<const dp::u8 *>(verdict.data().data());
                if (verdict.size() < 1 || bytes[0] != lan::AUTH_SUCCESS) {
                    echo::error("lan: daemon rejected auth");
                    return dp::result::err(dp::Error::io_error("Authentication failed"));
                }

                stream.expires_never();
                ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            } catch (const boost::system::system_error &e) {
                echo::error("lan: connect to ", endpoint_.to_string(), " failed: ", e.what());
                return dp::result::err(lan::from_system_error(e));
            }

            stats_.mark_connected();
            net::post(ws_.get_executor(), [this]() { start_read(); });
            echo::info("lan: connected to ", endpoint_.to_string());
            return dp::result::ok();
        }

        // Runs on the io thread
        void start_read() {
            ws_.async_read(read_buffer_, [this](lan::beast::error_code ec, std::size_t bytes) {
                if (ec) {
                    if (!closed_) {
                        echo::debug("lan: read loop ended: ", ec.message().c_str());
                    }
                    {
                        std::lock_guard<std::mutex> lock(inbox_mutex_);
                        read_failed_ = true;
                    }
                    inbox_cv_.notify_all();
                    return;
                }
                const auto *data = static_cast<const dp::u8 *>(read_buffer_.data().data());
                Message msg(data, data + bytes);
                read_buffer_.consume(read_buffer_.size());
                stats_.record_received(msg.size());
                {
                    std::lock_guard<std::mutex> lock(inbox_mutex_);
                    inbox_.push_back(std::move(msg));
                }
                inbox_cv_.notify_one();
                start_read();
            });
        }

      public:
        ~LanTransport() override { close(); }

        LanTransport(const LanTransport &) = delete;
        LanTransport &operator=(const LanTransport &) = delete;

        /// Connect, upgrade to ws://host:port/ws/<device_id> and authenticate
        static dp::Res<std::shared_ptr<LanTransport>> connect(const LanEndpoint &endpoint, const dp::String &device_id,
                                                              const Message &master_secret, const Config &config) {
            std::shared_ptr<LanTransport> transport(new LanTransport(endpoint));
            auto open_res = transport->open(device_id, master_secret, config);
            if (open_res.is_err()) {
                transport->close();
                return dp::result::err(open_res.error());
            }
            return dp::result::ok(transport);
        }

        dp::Res<void> send(const Message &msg) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("Transport is closed"));
            }

            // One write in flight at a time; the write itself must start on the io thread
            std::lock_guard<std::mutex> lock(send_mutex_);
            std::promise<lan::beast::error_code> done;
            auto done_future = done.get_future();
            lan::net::post(ws_.get_executor(), [this, &msg, &done]() {
                ws_.async_write(lan::net::buffer(msg.data(), msg.size()),
                                [&done](lan::beast::error_code ec, std::size_t) { done.set_value(ec); });
            });
            while (done_future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
                if (!io_running_) {
                    return dp::result::err(dp::Error::not_found("Transport is closed"));
                }
            }
            lan::beast::error_code ec = done_future.get();
            if (ec) {
                if (closed_ || ec == lan::websocket::error::closed) {
                    return dp::result::err(dp::Error::not_found("Transport is closed"));
                }
                echo::error("lan: send failed: ", ec.message().c_str());
                return dp::result::err(dp::Error::io_error(dp::String(ec.message().c_str())));
            }
            stats_.record_sent(msg.size());
            return dp::result::ok();
        }

        dp::Res<Message> recv(dp::u32 timeout_ms) override {
            std::unique_lock<std::mutex> lock(inbox_mutex_);
            bool ready = inbox_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                            [this] { return !inbox_.empty() || read_failed_ || closed_; });
            if (!inbox_.empty()) {
                Message msg = std::move(inbox_.front());
                inbox_.pop_front();
                return dp::result::ok(std::move(msg));
            }
            if (!ready) {
                return dp::result::err(dp::Error::timeout("Receive timeout"));
            }
            return dp::result::err(dp::Error::not_found("Transport is closed"));
        }

        void close() override {
            bool was_closed = closed_.exchange(true);
            if (!was_closed) {
                echo::debug("closing lan transport to ", endpoint_.to_string());
                lan::net::post(ws_.get_executor(), [this]() {
                    lan::beast::error_code ec;
                    auto &socket = lan::beast::get_lowest_layer(ws_).socket();
                    socket.shutdown(lan::tcp::socket::shutdown_both, ec);
                    socket.close(ec);
                });
                inbox_cv_.notify_all();
            }
            work_.reset();
            if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
                io_thread_.join();
            }
        }

        bool is_connected() const override { return !closed_; }

        TransportType type() const override { return TransportType::LAN_DIRECT; }

        TransportStatsSnapshot stats() const override { return stats_.snapshot(); }

        const LanEndpoint &endpoint() const { return endpoint_; }
    };

} // namespace raslink
