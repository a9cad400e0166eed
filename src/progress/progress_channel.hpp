#pragma once

#include <bootstrap/bootstrap_state.hpp>
#include <util/error.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace polarbear::progress {

/// @brief One progress update as observers see it.
struct ProgressMessage {
    uint8_t progress = 0;
    std::string message;
    bool is_error = false;

    auto operator==(const ProgressMessage&) const -> bool = default;
};

[[nodiscard]] auto message_from_state(const bootstrap::BootstrapState& state) -> ProgressMessage;

/// @brief `{"progress": n, "message": "...", "isError": b}`
[[nodiscard]] auto to_json(const ProgressMessage& message) -> std::string;
[[nodiscard]] auto parse_message(std::string_view text) -> Result<ProgressMessage>;

/// @brief True if the comma separated `Sec-WebSocket-Protocol` value offers @p wanted.
[[nodiscard]] auto offers_subprotocol(std::string_view header, std::string_view wanted) -> bool;

struct ChannelOptions {
    std::string address = "127.0.0.1";
    /// 0 binds an ephemeral port, see `ProgressChannel::port()`.
    uint16_t port = 3000;
    std::string subprotocol = "polarbear.progress.v1";
    /// Per-session send queue; the oldest pending message is dropped when full.
    size_t queue_limit = 64;
};

/**
 * @brief Loopback WebSocket broadcaster for bootstrap progress.
 *
 * Runs its own I/O thread. `publish()` only records the message and posts it to that thread,
 * so it never blocks whether or not anyone is connected. Every new session first receives the
 * last published message.
 */
class ProgressChannel {
public:
    [[nodiscard]] static auto create(ChannelOptions options) -> ResultPtr<ProgressChannel>;

    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;
    ProgressChannel(ProgressChannel&&) = delete;
    ProgressChannel& operator=(ProgressChannel&&) = delete;

    void publish(const ProgressMessage& message);
    [[nodiscard]] auto last() const -> std::optional<ProgressMessage>;
    [[nodiscard]] auto port() const -> uint16_t;
    [[nodiscard]] auto session_count() const -> size_t;

    /// Closes the listener and every session, then joins the I/O thread.
    void stop();

private:
    struct Impl;

    explicit ProgressChannel(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

} // namespace polarbear::progress
