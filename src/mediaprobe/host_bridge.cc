#include "mediaprobe/host_bridge.h"

#include "mediaprobe/batch_codec.h"
#include "mediaprobe/probe_timeline.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace mediaprobe {
namespace {

    using json = nlohmann::json;

    static constexpr const char* kBridgeMarker = "isStreamlitMessage";

}  // namespace


const char*
message_type_name(MessageType type) noexcept
{
    switch (type) {
    case MessageType::ComponentReady: return "streamlit:componentReady";
    case MessageType::SetComponentReady: return "streamlit:setComponentReady";
    case MessageType::SetComponentValue: return "streamlit:setComponentValue";
    case MessageType::SetFrameHeight: return "streamlit:setFrameHeight";
    }
    return "unknown";
}


const char*
bridge_state_name(BridgeState state) noexcept
{
    switch (state) {
    case BridgeState::Unconnected: return "unconnected";
    case BridgeState::Announcing: return "announcing";
    case BridgeState::Connected: return "connected";
    case BridgeState::DegradedPolling: return "degraded-polling";
    case BridgeState::Delivering: return "delivering";
    case BridgeState::Done: return "done";
    }
    return "unknown";
}


const char*
channel_kind_name(ChannelKind kind) noexcept
{
    switch (kind) {
    case ChannelKind::Undiscovered: return "undiscovered";
    case ChannelKind::Direct: return "direct";
    case ChannelKind::FallbackRedirect: return "fallback-redirect";
    }
    return "unknown";
}


const char*
delivery_channel_name(DeliveryChannel channel) noexcept
{
    switch (channel) {
    case DeliveryChannel::None: return "none";
    case DeliveryChannel::DirectObject: return "direct-object";
    case DeliveryChannel::ScopedMessage: return "scoped-message";
    case DeliveryChannel::Redirect: return "redirect";
    }
    return "unknown";
}


std::string
outbound_message_json(const OutboundMessage& message)
{
    json j           = json::object();
    j[kBridgeMarker] = true;
    j["type"]        = message_type_name(message.type);
    if (!message.broadcast && message.id) {
        j["id"] = *message.id;
    }
    switch (message.type) {
    case MessageType::ComponentReady:
        j["apiVersion"] = message.api_version;
        break;
    case MessageType::SetFrameHeight: j["height"] = message.height; break;
    case MessageType::SetComponentValue: {
        json value = json::parse(message.value_json, nullptr, false);
        if (value.is_discarded()) {
            j["value"] = message.value_json;
        } else {
            j["value"] = std::move(value);
        }
        break;
    }
    case MessageType::SetComponentReady: break;
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}


bool
parse_inbound_message(std::string_view json_text, InboundMessage* out)
{
    if (!out) {
        return false;
    }
    *out = InboundMessage {};

    const json j = json::parse(json_text.begin(), json_text.end(), nullptr,
                               false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }

    const auto type = j.find("type");
    if (type != j.end() && type->is_string()) {
        out->type = type->get<std::string>();
    }
    const auto marker = j.find(kBridgeMarker);
    if (marker != j.end() && marker->is_boolean()) {
        out->is_bridge_message = marker->get<bool>();
    }
    const auto id = j.find("id");
    if (id != j.end()) {
        if (id->is_string()) {
            out->id = id->get<std::string>();
        } else if (id->is_number() || id->is_boolean()) {
            out->id = id->dump();
        }
    }
    const auto args = j.find("args");
    if (args != j.end() && !args->is_null() && !args->empty()) {
        out->args_json = args->dump(-1, ' ', false,
                                    json::error_handler_t::replace);
    }
    return true;
}


BridgeProtocol::BridgeProtocol(EventLoop& loop, HostEnvironment& env,
                               BridgeSession& session, ProbeTimeline& timeline,
                               const BridgeOptions& options)
    : loop_(&loop)
    , env_(&env)
    , session_(&session)
    , timeline_(&timeline)
    , options_(options)
{
}


BridgeProtocol::~BridgeProtocol()
{
    cancel_timers();
    if (listening_) {
        timeline_->set_listener(nullptr);
        listening_ = false;
    }
}


BridgeState
BridgeProtocol::state() const noexcept
{
    return state_;
}


const BridgeSession&
BridgeProtocol::session() const noexcept
{
    return *session_;
}


bool
BridgeProtocol::timers_active() const noexcept
{
    return announce_timer_ != kInvalidTimerId
           || poll_timer_ != kInvalidTimerId;
}


uint32_t
BridgeProtocol::content_height() const noexcept
{
    const uint64_t h = static_cast<uint64_t>(options_.base_frame_height)
                       + static_cast<uint64_t>(options_.line_height)
                             * static_cast<uint64_t>(timeline_->size());
    return h > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(h);
}


void
BridgeProtocol::log(std::string_view message)
{
    timeline_->append(message);
}


void
BridgeProtocol::start()
{
    if (state_ != BridgeState::Unconnected) {
        return;
    }
    state_ = BridgeState::Announcing;

    timeline_->set_listener(
        [this](const TimelineEntry&) { request_resize(); });
    listening_ = true;

    log("Component loaded. Waiting for host render event...");
    poll_direct_host();
    if (state_ == BridgeState::Connected) {
        return;
    }
    announce();

    if (session_->attempt_count < options_.max_announces) {
        announce_timer_ = loop_->add_interval(options_.announce_interval_ms,
                                              [this]() { announce(); });
    }
    if (state_ == BridgeState::Announcing) {
        poll_timer_ = loop_->add_interval(options_.poll_interval_ms,
                                          [this]() { poll_direct_host(); });
    }
}


void
BridgeProtocol::announce()
{
    if (state_ != BridgeState::Announcing
        && state_ != BridgeState::DegradedPolling) {
        return;
    }
    if (session_->attempt_count >= options_.max_announces) {
        return;
    }

    OutboundMessage msg;
    msg.type        = MessageType::ComponentReady;
    msg.broadcast   = true;
    msg.api_version = 1;
    const bool first = session_->attempt_count == 0U;
    session_->attempt_count += 1;

    if (env_->post_message(msg)) {
        if (first) {
            log("Notified host that component is ready.");
        }
    } else if (!announce_error_logged_) {
        announce_error_logged_ = true;
        log("Failed to notify host of readiness.");
    }

    if (session_->attempt_count >= options_.max_announces) {
        if (announce_timer_ != kInvalidTimerId) {
            (void)loop_->cancel_timer(announce_timer_);
            announce_timer_ = kInvalidTimerId;
        }
        timeline_->appendf("No host response after announcing readiness %u "
                           "times.",
                           session_->attempt_count);
    }
}


void
BridgeProtocol::poll_direct_host()
{
    if (state_ != BridgeState::Announcing || direct_) {
        return;
    }

    session_->poll_count += 1;
    DirectHost* host = env_->find_direct_host();
    if (host) {
        connect_direct(host);
        return;
    }

    if (session_->poll_count >= options_.max_polls) {
        if (poll_timer_ != kInvalidTimerId) {
            (void)loop_->cancel_timer(poll_timer_);
            poll_timer_ = kInvalidTimerId;
        }
        state_                 = BridgeState::DegradedPolling;
        session_->channel_kind = ChannelKind::FallbackRedirect;
        log("Direct host object not detected after polling. Using message "
            "fallback only.");
    }
}


void
BridgeProtocol::enter_connected()
{
    cancel_timers();
    state_                 = BridgeState::Connected;
    session_->channel_kind = ChannelKind::Direct;
}


void
BridgeProtocol::connect_direct(DirectHost* host)
{
    direct_ = host;
    enter_connected();
    session_->capability = HostCapability::DirectObject;
    log("Detected direct host object.");
    if (!direct_->set_component_ready()) {
        log("Direct host object rejected setComponentReady.");
    }
    request_resize();
}


void
BridgeProtocol::connect_handshake(const InboundMessage& message)
{
    const bool first = !session_->host_id.has_value();
    session_->host_id = message.id ? *message.id : std::string();
    if (state_ == BridgeState::Connected && !first) {
        // Host re-render: keep the channel, refresh the id only.
        return;
    }

    enter_connected();
    if (!session_->capability) {
        session_->capability = HostCapability::MessageOnly;
    }
    timeline_->appendf("Connected to host (component id: %s).",
                       session_->host_id->c_str());
    if (!message.args_json.empty()) {
        timeline_->appendf("Received args: %s", message.args_json.c_str());
    }

    if (direct_) {
        if (!direct_->set_component_ready()) {
            log("Direct host object rejected setComponentReady.");
        }
    } else {
        OutboundMessage ready;
        ready.type = MessageType::SetComponentReady;
        (void)post_scoped(std::move(ready));
    }
    request_resize();
}


void
BridgeProtocol::on_message(const InboundMessage& message)
{
    if (message.type.empty()) {
        return;
    }
    if (message.is_bridge_message && !*message.is_bridge_message) {
        return;
    }
    if (message.type != kRenderMessageType) {
        return;
    }
    if (state_ == BridgeState::Unconnected || state_ == BridgeState::Delivering
        || state_ == BridgeState::Done) {
        return;
    }
    connect_handshake(message);
}


bool
BridgeProtocol::post_scoped(OutboundMessage message)
{
    if (!session_->host_id) {
        return false;
    }
    message.broadcast = false;
    message.id        = session_->host_id;
    if (env_->post_message(message)) {
        return true;
    }
    if (!post_error_logged_) {
        post_error_logged_ = true;
        log("Posting a message to the host failed.");
    }
    return false;
}


void
BridgeProtocol::request_resize()
{
    if (resizing_ || state_ == BridgeState::Done
        || state_ == BridgeState::Unconnected) {
        return;
    }
    resizing_ = true;

    const uint32_t height = content_height();
    bool ok               = false;
    if (direct_) {
        ok = direct_->set_frame_height(height);
    } else {
        OutboundMessage msg;
        msg.type   = MessageType::SetFrameHeight;
        msg.height = height;
        if (session_->host_id) {
            msg.broadcast = false;
            msg.id        = session_->host_id;
        }
        ok = env_->post_message(msg);
    }

    if (!ok && !resize_error_logged_) {
        resize_error_logged_ = true;
        log("Unable to request frame resize.");
    }
    resizing_ = false;
}


void
BridgeProtocol::cancel_timers() noexcept
{
    if (announce_timer_ != kInvalidTimerId) {
        (void)loop_->cancel_timer(announce_timer_);
        announce_timer_ = kInvalidTimerId;
    }
    if (poll_timer_ != kInvalidTimerId) {
        (void)loop_->cancel_timer(poll_timer_);
        poll_timer_ = kInvalidTimerId;
    }
}


void
BridgeProtocol::release()
{
    cancel_timers();
    state_ = BridgeState::Done;
    if (listening_) {
        timeline_->set_listener(nullptr);
        listening_ = false;
    }
}


DeliveryResult
BridgeProtocol::deliver(const ProbePayload& payload)
{
    DeliveryResult result;
    if (state_ == BridgeState::Delivering || state_ == BridgeState::Done) {
        return result;
    }
    cancel_timers();
    state_ = BridgeState::Delivering;

    // 1. Direct host object.
    if (direct_) {
        log("Delivering results via direct host object...");
        if (direct_->set_component_value(payload)) {
            log("Results delivered via direct host object.");
            result.status  = DeliveryStatus::Delivered;
            result.channel = DeliveryChannel::DirectObject;
            release();
            return result;
        }
        log("setComponentValue via direct host object failed.");
    }

    // 2. Session-scoped message.
    if (session_->host_id) {
        log("Delivering results via host message...");
        OutboundMessage msg;
        msg.type       = MessageType::SetComponentValue;
        msg.value_json = outbound_value_json(payload);
        if (post_scoped(std::move(msg))) {
            log("Results delivered via host message.");
            result.status  = DeliveryStatus::Delivered;
            result.channel = DeliveryChannel::ScopedMessage;
            release();
            return result;
        }
        log("Host message delivery failed.");
    } else {
        log("Cannot send results to host (no component id).");
    }

    // 3. Top-level navigation carrying the encoded batch.
    const std::string base = env_->host_base_url();
    if (base.empty()) {
        log("Redirect fallback unavailable (host URL unknown).");
    } else {
        result.redirect_url = build_redirect_url(base,
                                                 encode_results_param(payload));
        timeline_->appendf("Redirecting host with encoded results (%zu "
                           "characters).",
                           result.redirect_url.size());
        if (env_->navigate_top(result.redirect_url)) {
            session_->channel_kind = ChannelKind::FallbackRedirect;
            result.status          = DeliveryStatus::Delivered;
            result.channel         = DeliveryChannel::Redirect;
            release();
            return result;
        }
        log("Redirect fallback failed.");
    }

    log("All delivery channels failed; results are only available locally.");
    result.status = DeliveryStatus::AllChannelsFailed;
    release();
    return result;
}


void
BridgeProtocol::shutdown()
{
    if (state_ == BridgeState::Done) {
        return;
    }
    release();
}

}  // namespace mediaprobe
