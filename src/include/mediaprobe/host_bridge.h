#pragma once

#include "mediaprobe/event_loop.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * \file host_bridge.h
 * \brief Handshake and delivery protocol between the probe sandbox and its host.
 *
 * The sandbox cannot call the host directly. At runtime it discovers one of
 * two relationships (see \ref HostCapability): a directly-callable host
 * object, or a message-only channel keyed by a session id the host assigns
 * in its handshake. When neither is available the batch is handed back
 * through a top-level navigation carrying the encoded results.
 */

namespace mediaprobe {

class ProbeTimeline;
struct ProbePayload;

enum class BridgeState : uint8_t {
    Unconnected,
    Announcing,
    Connected,
    DegradedPolling,
    Delivering,
    Done,
};

enum class ChannelKind : uint8_t {
    Undiscovered,
    Direct,
    FallbackRedirect,
};

/// Relationship with the host confirmed during the handshake.
enum class HostCapability : uint8_t {
    DirectObject,
    MessageOnly,
};

/// State of the single handshake owned by the sandbox entry point.
struct BridgeSession final {
    /// Session id assigned by the host; absent until the handshake.
    std::optional<std::string> host_id;
    ChannelKind channel_kind = ChannelKind::Undiscovered;
    /// Readiness broadcasts sent.
    uint32_t attempt_count = 0;
    /// Direct host object polls performed.
    uint32_t poll_count = 0;
    std::optional<HostCapability> capability;
};

enum class MessageType : uint8_t {
    ComponentReady,
    SetComponentReady,
    SetComponentValue,
    SetFrameHeight,
};

/// Wire name, e.g. `"streamlit:componentReady"`.
const char*
message_type_name(MessageType type) noexcept;

/// Inbound handshake type.
inline constexpr std::string_view kRenderMessageType = "streamlit:render";

struct OutboundMessage final {
    MessageType type = MessageType::ComponentReady;
    /// Sent to the wildcard destination (no session id).
    bool broadcast = true;
    std::optional<std::string> id;
    uint32_t api_version = 0;
    uint32_t height      = 0;
    /// JSON text of the component value (SetComponentValue only).
    std::string value_json;
};

/// Serializes \p message as the host's JSON message object.
std::string
outbound_message_json(const OutboundMessage& message);

struct InboundMessage final {
    std::string type;
    /// Explicit marker; `false` means "not a bridge message".
    std::optional<bool> is_bridge_message;
    std::optional<std::string> id;
    /// Compact JSON text of `args`, empty if absent or empty.
    std::string args_json;
};

/// Parses a host message; returns false for non-JSON or non-object input.
bool
parse_inbound_message(std::string_view json_text, InboundMessage* out);

/// A host object the sandbox can call directly.
class DirectHost {
public:
    virtual ~DirectHost() = default;

    virtual bool set_component_value(const ProbePayload& payload) = 0;
    virtual bool set_component_ready()                            = 0;
    virtual bool set_frame_height(uint32_t height)                = 0;
};

/// Everything the protocol needs from the embedding environment.
class HostEnvironment {
public:
    virtual ~HostEnvironment() = default;

    /// Returns the directly-callable host object if reachable, else null.
    virtual DirectHost* find_direct_host() = 0;
    /// Returns false if the message could not be posted.
    virtual bool post_message(const OutboundMessage& message) = 0;
    /// URL of the top-level host document; empty if unknown.
    virtual std::string host_base_url() const = 0;
    /// Navigates the top-level host document; false if not permitted.
    virtual bool navigate_top(const std::string& url) = 0;
};

struct BridgeOptions final {
    uint64_t announce_interval_ms = 1500;
    uint32_t max_announces        = 10;
    uint64_t poll_interval_ms     = 250;
    uint32_t max_polls            = 40;
    /// Frame height model: base + line_height * timeline entries.
    uint32_t base_frame_height = 240;
    uint32_t line_height       = 18;
};

enum class DeliveryStatus : uint8_t {
    Delivered,
    /// Every channel failed; results stay local.
    AllChannelsFailed,
    /// The protocol already delivered or was shut down.
    NotReady,
};

enum class DeliveryChannel : uint8_t {
    None,
    DirectObject,
    ScopedMessage,
    Redirect,
};

struct DeliveryResult final {
    DeliveryStatus status   = DeliveryStatus::NotReady;
    DeliveryChannel channel = DeliveryChannel::None;
    /// Navigation target when \ref DeliveryChannel::Redirect was attempted.
    std::string redirect_url;
};

const char*
bridge_state_name(BridgeState state) noexcept;
const char*
channel_kind_name(ChannelKind kind) noexcept;
const char*
delivery_channel_name(DeliveryChannel channel) noexcept;

/**
 * \brief The sandbox side of the host handshake.
 *
 * All timers are cancelled as soon as a channel is confirmed, delivery
 * starts or the protocol shuts down; a tick that was already due at that
 * point does nothing. While running, the protocol listens to the timeline
 * and asks the host to resize the frame after every entry.
 */
class BridgeProtocol final {
public:
    BridgeProtocol(EventLoop& loop, HostEnvironment& env,
                   BridgeSession& session, ProbeTimeline& timeline,
                   const BridgeOptions& options = BridgeOptions {});
    ~BridgeProtocol();

    BridgeProtocol(const BridgeProtocol&)            = delete;
    BridgeProtocol& operator=(const BridgeProtocol&) = delete;

    /// Unconnected -> Announcing. Polls and announces once immediately.
    void start();
    void on_message(const InboundMessage& message);
    /// Tries every channel in priority order; moves to Done.
    DeliveryResult deliver(const ProbePayload& payload);
    /// Sandbox unload: Done from any state.
    void shutdown();

    BridgeState state() const noexcept;
    const BridgeSession& session() const noexcept;
    bool timers_active() const noexcept;
    uint32_t content_height() const noexcept;

private:
    void announce();
    void poll_direct_host();
    void connect_direct(DirectHost* host);
    void connect_handshake(const InboundMessage& message);
    void enter_connected();
    void cancel_timers() noexcept;
    void release();
    void request_resize();
    bool post_scoped(OutboundMessage message);
    void log(std::string_view message);

    EventLoop* loop_          = nullptr;
    HostEnvironment* env_     = nullptr;
    BridgeSession* session_   = nullptr;
    ProbeTimeline* timeline_  = nullptr;
    BridgeOptions options_;

    BridgeState state_      = BridgeState::Unconnected;
    DirectHost* direct_     = nullptr;
    TimerId announce_timer_ = kInvalidTimerId;
    TimerId poll_timer_     = kInvalidTimerId;

    bool listening_             = false;
    bool resizing_              = false;
    bool resize_error_logged_   = false;
    bool post_error_logged_     = false;
    bool announce_error_logged_ = false;
};

}  // namespace mediaprobe
