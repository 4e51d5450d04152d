#include "mediaprobe/probe_sandbox.h"

#include "mediaprobe/batch_codec.h"

#include <utility>

namespace mediaprobe {

ProbeSandbox::ProbeSandbox(EventLoop& loop, HostEnvironment& env,
                           const SandboxOptions& options)
    : options_(options)
    , timeline_(loop)
    , bridge_(loop, env, session_, timeline_, options.bridge)
    , batch_(loop, options.batch, &timeline_)
{
}


ProbeSandbox::~ProbeSandbox()
{
    unload();
}


void
ProbeSandbox::load()
{
    bridge_.start();
}


bool
ProbeSandbox::analyze(std::vector<std::unique_ptr<ByteSource>> sources,
                      Completion done)
{
    if (batch_.running() || bridge_.state() == BridgeState::Delivering
        || bridge_.state() == BridgeState::Done) {
        return false;
    }
    done_ = std::move(done);
    timeline_.appendf("Analysis started (bridge %s).",
                      bridge_state_name(bridge_.state()));
    return batch_.run(std::move(sources),
                      [this](const std::vector<FileRecord>& records) {
                          on_batch_done(records);
                      });
}


void
ProbeSandbox::on_batch_done(const std::vector<FileRecord>& records)
{
    timeline_.appendf("Analysis complete. Preparing %zu result(s) for "
                      "return.",
                      records.size());

    const ProbePayload payload = make_probe_payload(records, timeline_.lines());
    timeline_.appendf("Encoded payload size (base64): %llu characters.",
                      static_cast<unsigned long long>(
                          payload.payload_size_hint));

    SandboxResult result;
    result.records  = records;
    result.delivery = bridge_.deliver(payload);
    result.timeline = timeline_.lines();

    Completion done = std::move(done_);
    done_           = nullptr;
    if (done) {
        done(result);
    }
}


void
ProbeSandbox::on_host_message(const InboundMessage& message)
{
    bridge_.on_message(message);
}


bool
ProbeSandbox::on_host_message_json(std::string_view json_text)
{
    InboundMessage message;
    if (!parse_inbound_message(json_text, &message)) {
        return false;
    }
    bridge_.on_message(message);
    return true;
}


void
ProbeSandbox::unload()
{
    batch_.cancel();
    bridge_.shutdown();
    done_ = nullptr;
}


const ProbeTimeline&
ProbeSandbox::timeline() const noexcept
{
    return timeline_;
}


const BridgeSession&
ProbeSandbox::session() const noexcept
{
    return session_;
}


const BridgeProtocol&
ProbeSandbox::bridge() const noexcept
{
    return bridge_;
}


bool
ProbeSandbox::analyzing() const noexcept
{
    return batch_.running();
}

}  // namespace mediaprobe
