#include "progress_channel.hpp"

#include <util/logging.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <set>
#include <thread>

namespace polarbear::progress {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(10);

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

class Session;

/// State shared by the acceptor and its sessions. Only touched on the I/O thread.
struct Hub {
    std::string subprotocol;
    size_t queue_limit = 64;
    std::optional<std::string> last_text;
    std::set<std::shared_ptr<Session>> sessions;
    std::atomic<size_t> session_count{0};

    void add(std::shared_ptr<Session> session) {
        sessions.insert(std::move(session));
        session_count = sessions.size();
    }
    void remove(const std::shared_ptr<Session>& session) {
        sessions.erase(session);
        session_count = sessions.size();
    }
};

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, Hub& hub) : m_ws(std::move(socket)), m_hub(hub) {}

    void run() {
        beast::get_lowest_layer(m_ws).expires_after(HANDSHAKE_TIMEOUT);
        http::async_read(m_ws.next_layer(), m_buffer, m_request,
                         beast::bind_front_handler(&Session::on_request, shared_from_this()));
    }

    void send(const std::string& text) {
        if (m_queue.size() >= m_hub.queue_limit) {
            m_queue.pop_front();
        }
        m_queue.push_back(text);
        if (!m_writing) {
            write_next();
        }
    }

    void close() {
        beast::error_code ec;
        beast::get_lowest_layer(m_ws).socket().close(ec);
        if (ec) {
            POLARBEAR_LOG_DEBUG("Progress session close: {}", ec.message());
        }
    }

private:
    void on_request(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            POLARBEAR_LOG_DEBUG("Progress handshake read failed: {}", ec.message());
            return;
        }
        const auto offered = m_request[http::field::sec_websocket_protocol];
        if (!websocket::is_upgrade(m_request) ||
            !offers_subprotocol(std::string_view(offered.data(), offered.size()),
                                m_hub.subprotocol)) {
            reject();
            return;
        }

        beast::get_lowest_layer(m_ws).expires_never();
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        m_ws.set_option(websocket::stream_base::decorator(
            [protocol = m_hub.subprotocol](websocket::response_type& res) {
                res.set(http::field::sec_websocket_protocol, protocol);
                res.set(http::field::server, "polarbear");
            }));
        m_ws.async_accept(m_request,
                          beast::bind_front_handler(&Session::on_accept, shared_from_this()));
    }

    void reject() {
        POLARBEAR_LOG_DEBUG("Rejecting progress connection without subprotocol {}",
                            m_hub.subprotocol);
        m_response.version(m_request.version());
        m_response.result(http::status::bad_request);
        m_response.set(http::field::content_type, "text/plain");
        m_response.keep_alive(false);
        m_response.body() = "expected websocket subprotocol " + m_hub.subprotocol + "\n";
        m_response.prepare_payload();
        http::async_write(m_ws.next_layer(), m_response,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) {
                              if (ec) {
                                  POLARBEAR_LOG_DEBUG("Progress reject write failed: {}",
                                                      ec.message());
                              }
                              self->close();
                          });
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            POLARBEAR_LOG_DEBUG("Progress websocket accept failed: {}", ec.message());
            return;
        }
        m_hub.add(shared_from_this());
        POLARBEAR_LOG_DEBUG("Progress observer connected ({} total)", m_hub.sessions.size());
        if (m_hub.last_text) {
            send(*m_hub.last_text);
        }
        do_read();
    }

    // Observers never send anything meaningful; reading only detects the close.
    void do_read() {
        m_ws.async_read(m_read_buffer,
                        beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                POLARBEAR_LOG_DEBUG("Progress observer dropped: {}", ec.message());
            }
            m_hub.remove(shared_from_this());
            return;
        }
        m_read_buffer.consume(m_read_buffer.size());
        do_read();
    }

    void write_next() {
        m_writing = true;
        m_current = std::move(m_queue.front());
        m_queue.pop_front();
        m_ws.text(true);
        m_ws.async_write(asio::buffer(m_current),
                         beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /*bytes*/) {
        m_writing = false;
        if (ec) {
            POLARBEAR_LOG_DEBUG("Progress write failed: {}", ec.message());
            m_hub.remove(shared_from_this());
            return;
        }
        if (!m_queue.empty()) {
            write_next();
        }
    }

    websocket::stream<beast::tcp_stream> m_ws;
    Hub& m_hub;
    beast::flat_buffer m_buffer;
    beast::flat_buffer m_read_buffer;
    http::request<http::string_body> m_request;
    http::response<http::string_body> m_response;
    std::deque<std::string> m_queue;
    std::string m_current;
    bool m_writing = false;
};

} // namespace

auto message_from_state(const bootstrap::BootstrapState& state) -> ProgressMessage {
    return ProgressMessage{
        .progress = state.percent,
        .message = state.message,
        .is_error = state.is_error(),
    };
}

auto to_json(const ProgressMessage& message) -> std::string {
    const nlohmann::json json = {
        {"progress", message.progress},
        {"message", message.message},
        {"isError", message.is_error},
    };
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto parse_message(std::string_view text) -> Result<ProgressMessage> {
    const auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return make_error<ProgressMessage>(ErrorCode::parse_error, "Progress message is not a JSON object");
    }
    const auto progress = json.find("progress");
    const auto message = json.find("message");
    const auto is_error = json.find("isError");
    if (progress == json.end() || !progress->is_number_integer() || message == json.end() ||
        !message->is_string() || is_error == json.end() || !is_error->is_boolean()) {
        return make_error<ProgressMessage>(ErrorCode::parse_error,
                                           "Progress message is missing a field");
    }
    const auto value = progress->get<int64_t>();
    if (value < 0 || value > 100) {
        return make_error<ProgressMessage>(ErrorCode::invalid_data,
                                           "Progress out of range: " + std::to_string(value));
    }
    return ProgressMessage{
        .progress = static_cast<uint8_t>(value),
        .message = message->get<std::string>(),
        .is_error = is_error->get<bool>(),
    };
}

auto offers_subprotocol(std::string_view header, std::string_view wanted) -> bool {
    while (!header.empty()) {
        const auto comma = header.find(',');
        if (trim(header.substr(0, comma)) == wanted) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        header.remove_prefix(comma + 1);
    }
    return false;
}

// =============================================================================
// ProgressChannel
// =============================================================================

struct ProgressChannel::Impl {
    explicit Impl(const ChannelOptions& options) : acceptor(ioc) {
        hub.subprotocol = options.subprotocol;
        hub.queue_limit = std::max<size_t>(options.queue_limit, 1);
    }

    void do_accept() {
        acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                POLARBEAR_LOG_WARN("Progress accept failed: {}", ec.message());
            } else {
                std::make_shared<Session>(std::move(socket), hub)->run();
            }
            do_accept();
        });
    }

    asio::io_context ioc{1};
    tcp::acceptor acceptor;
    Hub hub;
    uint16_t bound_port = 0;
    std::jthread thread;
    bool stopped = false;

    mutable std::mutex mutex;
    std::optional<ProgressMessage> last;
};

ProgressChannel::ProgressChannel(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}

ProgressChannel::~ProgressChannel() {
    stop();
}

auto ProgressChannel::create(ChannelOptions options) -> ResultPtr<ProgressChannel> {
    auto impl = std::make_unique<Impl>(options);

    beast::error_code ec;
    const auto address = asio::ip::make_address(options.address, ec);
    if (ec) {
        return make_result_ptr_error<ProgressChannel>(
            ErrorCode::progress_channel_failed,
            "Invalid progress address '" + options.address + "': " + ec.message());
    }
    const tcp::endpoint endpoint{address, options.port};

    auto fail = [&](const char* what) {
        return make_result_ptr_error<ProgressChannel>(
            ErrorCode::progress_channel_failed,
            std::string(what) + " " + options.address + ":" + std::to_string(options.port) + ": " +
                ec.message());
    };

    impl->acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        return fail("Cannot open progress socket");
    }
    impl->acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        return fail("Cannot set SO_REUSEADDR on");
    }
    impl->acceptor.bind(endpoint, ec);
    if (ec) {
        return fail("Cannot bind progress socket to");
    }
    impl->acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return fail("Cannot listen on");
    }
    impl->bound_port = impl->acceptor.local_endpoint(ec).port();
    if (ec) {
        return fail("Cannot query progress socket");
    }

    impl->do_accept();
    impl->thread = std::jthread([ptr = impl.get()] { ptr->ioc.run(); });

    POLARBEAR_LOG_INFO("Progress channel listening on ws://{}:{} ({})", options.address,
                       impl->bound_port, options.subprotocol);
    return make_result_ptr(std::unique_ptr<ProgressChannel>(new ProgressChannel(std::move(impl))));
}

void ProgressChannel::publish(const ProgressMessage& message) {
    {
        std::lock_guard lock(m_impl->mutex);
        if (m_impl->stopped) {
            return;
        }
        m_impl->last = message;
    }
    asio::post(m_impl->ioc, [impl = m_impl.get(), text = to_json(message)] {
        impl->hub.last_text = text;
        for (const auto& session : impl->hub.sessions) {
            session->send(text);
        }
    });
}

auto ProgressChannel::last() const -> std::optional<ProgressMessage> {
    std::lock_guard lock(m_impl->mutex);
    return m_impl->last;
}

auto ProgressChannel::port() const -> uint16_t {
    return m_impl->bound_port;
}

auto ProgressChannel::session_count() const -> size_t {
    return m_impl->hub.session_count;
}

void ProgressChannel::stop() {
    {
        std::lock_guard lock(m_impl->mutex);
        if (m_impl->stopped) {
            return;
        }
        m_impl->stopped = true;
    }
    asio::post(m_impl->ioc, [impl = m_impl.get()] {
        beast::error_code ec;
        impl->acceptor.close(ec);
        for (const auto& session : impl->hub.sessions) {
            session->close();
        }
        impl->hub.sessions.clear();
        impl->hub.session_count = 0;
        impl->ioc.stop();
    });
    if (m_impl->thread.joinable()) {
        m_impl->thread.join();
    }
    POLARBEAR_LOG_DEBUG("Progress channel stopped");
}

} // namespace polarbear::progress
