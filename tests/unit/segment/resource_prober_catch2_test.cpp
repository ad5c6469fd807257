#include <catch2/catch_test_macros.hpp>

#include <parfetch/segment/resource_prober.h>

#include <atomic>
#include <deque>
#include <mutex>

using namespace parfetch;
using namespace parfetch::segment;
using namespace std::chrono_literals;

namespace {

// Answers metadata requests from a script of failures, then succeeds.
class ScriptedAdapter final : public net::IProtocolAdapter {
public:
    Expected<net::ResourceInfo> probe(const net::ResourceRequest& request,
                                      const ShouldCancel&) override {
        ++calls;
        std::lock_guard<std::mutex> lk(mutex_);
        if (!failures.empty()) {
            auto e = failures.front();
            failures.pop_front();
            return e;
        }
        net::ResourceInfo info;
        info.url = request.url;
        info.size = 1234;
        info.rangeSupported = true;
        info.rtt = 40ms;
        return info;
    }

    Expected<void> fetchRange(const net::ResourceInfo&, ByteRange, net::Stream&,
                              const net::DataSink&, const net::TransferProgress&,
                              const ShouldCancel&) override {
        return Error{ErrorCode::Unknown, "not used"};
    }

    Expected<void> fetchFull(const net::ResourceInfo&, net::Stream&, const net::DataSink&,
                             const net::TransferProgress&, const ShouldCancel&) override {
        return Error{ErrorCode::Unknown, "not used"};
    }

    std::deque<Error> failures;
    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
};

RetryPolicy fastPolicy(int attempts) {
    RetryPolicy p;
    p.maxAttempts = attempts;
    p.initialBackoff = 1ms;
    p.maxBackoff = 4ms;
    return p;
}

const net::ResourceRequest kRequest{"https://files.example.com/a.bin", {}};

} // namespace

TEST_CASE("ResourceProber: transient failures are retried", "[segment][resource]") {
    ScriptedAdapter adapter;
    adapter.failures = {Error{ErrorCode::Timeout, "slow"},
                        Error{ErrorCode::ServerRejected, "busy", 503}};
    bandwidth::BandwidthMonitor monitor;
    ResourceProber prober(adapter, fastPolicy(5), &monitor);

    auto r = prober.probe(kRequest, nullptr);
    REQUIRE(r.ok());
    CHECK(adapter.calls == 3);
    CHECK(r.value().size == std::optional<std::uint64_t>(1234));
    REQUIRE(monitor.smoothedRtt().has_value());
    CHECK(*monitor.smoothedRtt() == std::chrono::microseconds(40'000));
}

TEST_CASE("ResourceProber: permanent failures return immediately", "[segment][resource]") {
    ScriptedAdapter adapter;
    adapter.failures = {Error{ErrorCode::ServerRejected, "not found", 404}};
    ResourceProber prober(adapter, fastPolicy(5));

    auto r = prober.probe(kRequest, nullptr);
    REQUIRE_FALSE(r.ok());
    CHECK(adapter.calls == 1);
    CHECK(r.error().code == ErrorCode::ServerRejected);
    CHECK(r.error().status == std::optional<int>(404));
}

TEST_CASE("ResourceProber: exhausted attempts", "[segment][resource]") {
    ScriptedAdapter adapter;
    for (int i = 0; i < 5; ++i)
        adapter.failures.push_back(Error{ErrorCode::ConnectionReset, "reset"});
    ResourceProber prober(adapter, fastPolicy(3));

    auto r = prober.probe(kRequest, nullptr);
    REQUIRE_FALSE(r.ok());
    CHECK(adapter.calls == 3);
    CHECK(r.error().code == ErrorCode::ProbeFailed);
}

TEST_CASE("ResourceProber: cancellation", "[segment][resource]") {
    ScriptedAdapter adapter;
    ResourceProber prober(adapter, fastPolicy(3));

    auto r = prober.probe(kRequest, [] { return true; });
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::Cancelled);
    CHECK(adapter.calls == 0);
}
