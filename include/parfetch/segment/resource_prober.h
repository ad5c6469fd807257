#pragma once

#include <parfetch/bandwidth/bandwidth_monitor.h>
#include <parfetch/core/types.h>
#include <parfetch/net/protocol_adapter.h>

namespace parfetch::segment {

/**
 * Metadata exchange ahead of planning. Transient failures are retried with the
 * policy's exponential backoff; exhausting the attempts yields ProbeFailed.
 * The measured round-trip time seeds the bandwidth monitor when one is given.
 */
class ResourceProber {
public:
    ResourceProber(net::IProtocolAdapter& adapter, RetryPolicy policy,
                   bandwidth::BandwidthMonitor* monitor = nullptr)
        : adapter_(adapter), policy_(policy), monitor_(monitor) {}

    Expected<net::ResourceInfo> probe(const net::ResourceRequest& request,
                                      const ShouldCancel& shouldCancel);

private:
    net::IProtocolAdapter& adapter_;
    RetryPolicy policy_;
    bandwidth::BandwidthMonitor* monitor_;
};

} // namespace parfetch::segment
