#include <parfetch/segment/resource_prober.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace parfetch::segment {

Expected<net::ResourceInfo> ResourceProber::probe(const net::ResourceRequest& request,
                                                  const ShouldCancel& shouldCancel) {
    const int attempts = std::max(1, policy_.maxAttempts);
    Error last{ErrorCode::ProbeFailed, "probe not attempted"};

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (shouldCancel && shouldCancel())
            return Error{ErrorCode::Cancelled, "probe cancelled"};

        auto r = adapter_.probe(request, shouldCancel);
        if (r.ok()) {
            const auto& info = r.value();
            if (monitor_ && info.rtt.count() > 0)
                monitor_->recordRtt(info.rtt);
            spdlog::info("Probed {}: size={} ranges={} protocol={} etag={}", request.url,
                         info.size ? std::to_string(*info.size) : std::string("unknown"),
                         info.rangeSupported, net::generationToString(info.generation),
                         info.etag.value_or("-"));
            return r;
        }

        last = r.error();
        const bool retryable = isTransient(last) || last.code == ErrorCode::RateLimited;
        if (!retryable)
            return last;
        if (attempt == attempts)
            break;

        const auto wait = policy_.backoffFor(attempt);
        spdlog::warn("Probe attempt {}/{} for {} failed ({}); retrying in {}ms", attempt, attempts,
                     request.url, describe(last), wait.count());
        if (!sleepCancellable(wait, shouldCancel))
            return Error{ErrorCode::Cancelled, "probe cancelled"};
    }

    return Error{ErrorCode::ProbeFailed,
                 "probe failed after " + std::to_string(attempts) + " attempts: " + describe(last),
                 last.status};
}

} // namespace parfetch::segment
