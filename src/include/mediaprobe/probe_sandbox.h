#pragma once

#include "mediaprobe/batch_probe.h"
#include "mediaprobe/host_bridge.h"
#include "mediaprobe/probe_timeline.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file probe_sandbox.h
 * \brief Entry point of the sandboxed probe: batch probing plus host delivery.
 */

namespace mediaprobe {

struct SandboxOptions final {
    BatchOptions batch;
    BridgeOptions bridge;
};

/// Outcome of one analysis run.
struct SandboxResult final {
    std::vector<FileRecord> records;
    /// Full rendered timeline, including delivery lines.
    std::vector<std::string> timeline;
    DeliveryResult delivery;
};

/**
 * \brief Owns the run's \ref ProbeTimeline, \ref BridgeSession,
 * \ref BridgeProtocol and \ref BatchProbe.
 *
 * One sandbox serves one batch: after delivery the bridge is Done and
 * further \ref analyze calls are rejected.
 */
class ProbeSandbox final {
public:
    using Completion = std::function<void(const SandboxResult& result)>;

    ProbeSandbox(EventLoop& loop, HostEnvironment& env,
                 const SandboxOptions& options = SandboxOptions {});
    ~ProbeSandbox();

    ProbeSandbox(const ProbeSandbox&)            = delete;
    ProbeSandbox& operator=(const ProbeSandbox&) = delete;

    /// Starts the host handshake.
    void load();
    /// Probes \p sources, then delivers the batch to the host.
    bool analyze(std::vector<std::unique_ptr<ByteSource>> sources,
                 Completion done);

    void on_host_message(const InboundMessage& message);
    /// Parses and dispatches a raw JSON host message; false if unparsable.
    bool on_host_message_json(std::string_view json_text);

    /// Cancels any running batch and releases the bridge.
    void unload();

    const ProbeTimeline& timeline() const noexcept;
    const BridgeSession& session() const noexcept;
    const BridgeProtocol& bridge() const noexcept;
    bool analyzing() const noexcept;

private:
    void on_batch_done(const std::vector<FileRecord>& records);

    SandboxOptions options_;
    ProbeTimeline timeline_;
    BridgeSession session_;
    BridgeProtocol bridge_;
    BatchProbe batch_;
    Completion done_;
};

}  // namespace mediaprobe
