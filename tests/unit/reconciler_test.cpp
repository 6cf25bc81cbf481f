#include "discovery/reconciler.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <memory>

#include "mocks/mock_device_registry.hpp"
#include "mocks/mock_publisher.hpp"
#include "mocks/mock_vendor_adapter.hpp"
#include "store/in_memory_store.hpp"

using namespace micsync;
using namespace micsync::discovery;
using namespace micsync::tests;
using namespace testing;

using IpList = std::vector<std::string>;

class ReconcilerTest : public Test {
protected:
    void SetUp() override {
        adapter = std::make_shared<StrictMock<MockVendorAdapter>>();
        adapter->_id = "shure-main";
        EXPECT_CALL(*adapter, vendor_id()).WillRepeatedly(ReturnRef(adapter->_id));
        EXPECT_CALL(*adapter, last_error()).WillRepeatedly(Return("vendor said no"));
        vendors.add_adapter("shure-main", adapter);

        store = std::make_shared<store::InMemoryStore>();
        progress = std::make_shared<ProgressTracker>(store, nullptr, "discovery.progress");
        emitter = std::make_shared<events::EventEmitter>();

        reconciler = std::make_unique<Reconciler>(
            vendors, devices, progress, emitter,
            [this](const std::string &name, std::vector<std::string> &addresses, std::string &error) {
                if (on_resolve) {
                    on_resolve(name);
                }
                auto it = dns.find(name);
                if (it == dns.end()) {
                    error = "NXDOMAIN";
                    return false;
                }
                addresses = it->second;
                return true;
            });
    }

    // Successive get_discovery_ips() calls return these lists in order
    void remote_lists(const std::vector<IpList> &lists) {
        auto &expectation = EXPECT_CALL(*adapter, get_discovery_ips(_));
        for (const auto &list : lists) {
            expectation.WillOnce(DoAll(SetArgReferee<0>(list), Return(true)));
        }
    }

    ScanProgress progress_for(const std::string &key) {
        auto p = progress->get(key);
        EXPECT_TRUE(p.has_value());
        return p.value_or(ScanProgress{});
    }

    const std::string kKey = "discovery:status:shure-main";

    vendor::VendorRegistry vendors;
    NiceMock<MockDeviceRegistry> devices;
    std::shared_ptr<StrictMock<MockVendorAdapter>> adapter;
    std::shared_ptr<store::InMemoryStore> store;
    std::shared_ptr<ProgressTracker> progress;
    std::shared_ptr<events::EventEmitter> emitter;
    std::map<std::string, IpList> dns;
    std::function<void(const std::string &)> on_resolve;
    std::unique_ptr<Reconciler> reconciler;
};

// ============================================================================
// Diff
// ============================================================================

TEST(ComputeDiffTest, AddsMissingAndRemovesStale) {
    auto diff = Reconciler::compute_diff({"10.0.0.1", "10.0.0.2"}, {"10.0.0.2", "10.0.0.3"});
    EXPECT_EQ(diff.to_add, (IpList{"10.0.0.3"}));
    EXPECT_EQ(diff.to_remove, (IpList{"10.0.0.1"}));
}

TEST(ComputeDiffTest, EqualSetsProduceNoChanges) {
    auto diff = Reconciler::compute_diff({"10.0.0.2", "10.0.0.1"}, {"10.0.0.1", "10.0.0.2", "10.0.0.1"});
    EXPECT_TRUE(diff.to_add.empty());
    EXPECT_TRUE(diff.to_remove.empty());
}

TEST(ComputeDiffTest, DuplicatesAreCollapsed) {
    auto diff = Reconciler::compute_diff({"10.0.0.9", "10.0.0.9"}, {"10.0.0.1", "10.0.0.1"});
    EXPECT_EQ(diff.to_add, (IpList{"10.0.0.1"}));
    EXPECT_EQ(diff.to_remove, (IpList{"10.0.0.9"}));
}

// ============================================================================
// Candidate gathering
// ============================================================================

TEST_F(ReconcilerTest, GatherMergesAllSourcesInOrder) {
    remote_lists({{"10.0.0.1", "bogus"}});
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2", "10.0.0.1"}));
    dns["rx.example.com"] = {"10.0.0.9", "fd00::9"};

    ScanOptions opts{{"192.168.1.0/30"}, {"rx.example.com"}, 1024};
    auto candidates = reconciler->gather_candidates("shure-main", opts);

    EXPECT_EQ(candidates, (IpList{"10.0.0.1", "10.0.0.2", "192.168.1.1", "192.168.1.2", "10.0.0.9"}));
}

TEST_F(ReconcilerTest, GatherContinuesWithoutRemoteList) {
    EXPECT_CALL(*adapter, get_discovery_ips(_)).WillOnce(Return(false));
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2"}));

    auto candidates = reconciler->gather_candidates("shure-main", ScanOptions{});
    EXPECT_EQ(candidates, (IpList{"10.0.0.2"}));
}

TEST_F(ReconcilerTest, GatherRespectsMaxHostsPerCidr) {
    remote_lists({{}});

    ScanOptions opts{{"10.1.0.0/16", "10.2.0.0/16"}, {}, 2};
    auto candidates = reconciler->gather_candidates("shure-main", opts);
    EXPECT_EQ(candidates, (IpList{"10.1.0.1", "10.1.0.2", "10.2.0.1", "10.2.0.2"}));
}

TEST_F(ReconcilerTest, UnresolvableNameDoesNotStopScan) {
    remote_lists({{}});
    dns["good.example.com"] = {"10.0.0.4"};

    ScanOptions opts{{}, {"bad.example.com", "good.example.com"}, 1024};
    auto candidates = reconciler->gather_candidates("shure-main", opts);
    EXPECT_EQ(candidates, (IpList{"10.0.0.4"}));
}

TEST_F(ReconcilerTest, GatherForUnknownVendorIsEmpty) {
    EXPECT_TRUE(reconciler->gather_candidates("nobody", ScanOptions{}).empty());
}

// ============================================================================
// Progress
// ============================================================================

TEST_F(ReconcilerTest, RunWithProgressFinishesWithCandidateCount) {
    remote_lists({{"10.0.0.1"}});
    dns["rx.example.com"] = {"10.0.0.9"};

    ScanOptions opts{{"192.168.1.0/30"}, {"rx.example.com"}, 1024};
    IpList candidates;
    std::string error;
    ASSERT_TRUE(reconciler->run_with_progress("shure-main", kKey, opts, candidates, error)) << error;

    EXPECT_EQ(candidates.size(), 4u);
    ScanProgress p = progress_for(kKey);
    EXPECT_EQ(p.status, ScanStatus::DONE);
    EXPECT_EQ(p.items_total, 3);
    EXPECT_EQ(p.items_processed, 3);
    EXPECT_EQ(p.count.value_or(-1), 4);
}

TEST_F(ReconcilerTest, RunWithProgressFailsWhenRemoteUnavailable) {
    EXPECT_CALL(*adapter, get_discovery_ips(_)).WillOnce(Return(false));

    IpList candidates;
    std::string error;
    EXPECT_FALSE(reconciler->run_with_progress("shure-main", kKey, ScanOptions{}, candidates, error));

    EXPECT_THAT(error, HasSubstr("remote discovery fetch failed"));
    ScanProgress p = progress_for(kKey);
    EXPECT_EQ(p.status, ScanStatus::ERROR);
    EXPECT_THAT(p.error.value_or(""), HasSubstr("vendor said no"));
}

TEST_F(ReconcilerTest, RunWithProgressUnknownVendorRecordsError) {
    IpList candidates;
    std::string error;
    EXPECT_FALSE(reconciler->run_with_progress("nobody", "discovery:status:nobody", ScanOptions{}, candidates, error));
    EXPECT_EQ(progress_for("discovery:status:nobody").status, ScanStatus::ERROR);
}

TEST_F(ReconcilerTest, RunWithProgressReportsEveryFiftyAddresses) {
    auto publisher = std::make_shared<NiceMock<MockPublisher>>();
    std::vector<nlohmann::json> envelopes;
    ON_CALL(*publisher, publish("discovery.progress", _))
        .WillByDefault(Invoke([&envelopes](const std::string &, const nlohmann::json &envelope) {
            envelopes.push_back(envelope);
            return true;
        }));
    auto tracked = std::make_shared<ProgressTracker>(store, publisher, "discovery.progress");
    Reconciler scanner(vendors, devices, tracked, nullptr);
    remote_lists({{}});

    ScanOptions opts{{"10.0.0.0/24"}, {}, 1024};
    IpList candidates;
    std::string error;
    ASSERT_TRUE(scanner.run_with_progress("shure-main", kKey, opts, candidates, error)) << error;
    EXPECT_EQ(candidates.size(), 254u);

    std::vector<int64_t> processed;
    std::vector<int64_t> running_updates;
    for (const auto &envelope : envelopes) {
        ASSERT_EQ(envelope.at("type"), "progress_update");
        const auto &status = envelope.at("status");
        EXPECT_EQ(status.at("items_total"), 254);
        processed.push_back(status.at("items_processed").get<int64_t>());
        if (status.at("status") == "running" && status.contains("current_cidr")) {
            EXPECT_EQ(status.at("current_cidr"), "10.0.0.0/24");
            running_updates.push_back(status.at("items_processed").get<int64_t>());
        }
    }

    EXPECT_EQ(running_updates, (std::vector<int64_t>{50, 100, 150, 200, 250, 254}));
    EXPECT_TRUE(std::is_sorted(processed.begin(), processed.end()));
    ASSERT_FALSE(envelopes.empty());
    EXPECT_EQ(envelopes.front().at("status").at("items_processed"), 0);
    EXPECT_EQ(envelopes.back().at("status").at("status"), "done");
    EXPECT_EQ(envelopes.back().at("status").at("count"), 254);
}

// ============================================================================
// Apply
// ============================================================================

TEST_F(ReconcilerTest, ApplyAddRefusesAddressOwnedElsewhere) {
    ON_CALL(devices, owners_of("10.0.0.2")).WillByDefault(Return(IpList{"senn"}));

    EXPECT_FALSE(reconciler->apply_add("10.0.0.2", "shure-main"));
}

TEST_F(ReconcilerTest, ApplyAddAndRemoveSingleAddress) {
    ON_CALL(devices, owners_of("10.0.0.2")).WillByDefault(Return(IpList{"shure-main"}));
    EXPECT_CALL(*adapter, add_discovery_ips(IpList{"10.0.0.2"})).WillOnce(Return(true));
    EXPECT_CALL(*adapter, remove_discovery_ips(IpList{"10.0.0.3"})).WillOnce(Return(true));

    EXPECT_TRUE(reconciler->apply_add("10.0.0.2", "shure-main"));
    EXPECT_TRUE(reconciler->apply_remove("10.0.0.3", "shure-main"));
    EXPECT_FALSE(reconciler->apply_remove("10.0.0.3", "nobody"));
}

// ============================================================================
// Full pass
// ============================================================================

TEST_F(ReconcilerTest, RunAddsMissingAndRemovesStale) {
    // Another tool added .77 between the gather and reconcile fetches
    remote_lists({{"10.0.0.1"}, {"10.0.0.1", "10.0.0.77"}});
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2"}));
    EXPECT_CALL(*adapter, add_discovery_ips(IpList{"10.0.0.2"})).WillOnce(Return(true));
    EXPECT_CALL(*adapter, remove_discovery_ips(IpList{"10.0.0.77"})).WillOnce(Return(true));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{});

    EXPECT_TRUE(summary.ok);
    EXPECT_EQ(summary.candidates, 2u);
    EXPECT_EQ(summary.to_add, 1u);
    EXPECT_EQ(summary.to_remove, 1u);
    EXPECT_EQ(summary.count(ItemOutcome::APPLIED), 2u);
    EXPECT_GE(summary.finished_at, summary.started_at);
}

TEST_F(ReconcilerTest, SecondPassIsNoOp) {
    remote_lists({{"10.0.0.1", "10.0.0.2"}, {"10.0.0.1", "10.0.0.2"}});
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2"}));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{});

    EXPECT_TRUE(summary.ok);
    EXPECT_EQ(summary.to_add, 0u);
    EXPECT_EQ(summary.to_remove, 0u);
    EXPECT_TRUE(summary.added.empty());
    EXPECT_TRUE(summary.removed.empty());
}

TEST_F(ReconcilerTest, RunSkipsAddressOwnedByAnotherVendor) {
    remote_lists({{}, {}});
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2", "10.0.0.3"}));
    ON_CALL(devices, owners_of("10.0.0.2")).WillByDefault(Return(IpList{"senn"}));
    EXPECT_CALL(*adapter, add_discovery_ips(IpList{"10.0.0.3"})).WillOnce(Return(true));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{});

    ASSERT_EQ(summary.added.size(), 2u);
    EXPECT_EQ(summary.added[0].ip, "10.0.0.2");
    EXPECT_EQ(summary.added[0].outcome, ItemOutcome::SKIPPED);
    EXPECT_EQ(summary.added[0].reason, "owned by senn");
    EXPECT_EQ(summary.added[1].outcome, ItemOutcome::APPLIED);
    EXPECT_TRUE(summary.ok);
}

TEST_F(ReconcilerTest, FailedAddIsRecordedAndPassContinues) {
    remote_lists({{"10.0.0.1"}, {"10.0.0.1", "10.0.0.8"}});
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2"}));
    EXPECT_CALL(*adapter, add_discovery_ips(_)).WillOnce(Return(false));
    EXPECT_CALL(*adapter, remove_discovery_ips(IpList{"10.0.0.8"})).WillOnce(Return(true));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{});

    EXPECT_TRUE(summary.ok);
    ASSERT_EQ(summary.added.size(), 1u);
    EXPECT_EQ(summary.added[0].outcome, ItemOutcome::FAILED);
    EXPECT_EQ(summary.added[0].reason, "vendor said no");
    EXPECT_EQ(summary.count(ItemOutcome::APPLIED), 1u);
    EXPECT_EQ(summary.to_json()["added"][0]["outcome"], "failed");
}

TEST_F(ReconcilerTest, RunFailsWhenRemoteUnavailable) {
    EXPECT_CALL(*adapter, get_discovery_ips(_)).WillOnce(Return(false));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{}, kKey);

    EXPECT_FALSE(summary.ok);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_THAT(summary.error, HasSubstr("remote discovery fetch failed"));
    EXPECT_EQ(progress_for(kKey).status, ScanStatus::ERROR);
}

TEST_F(ReconcilerTest, RunReportsReconcilingThenDone) {
    EXPECT_CALL(*adapter, get_discovery_ips(_))
        .WillOnce(DoAll(SetArgReferee<0>(IpList{"10.0.0.1"}), Return(true)))
        .WillOnce(Invoke([this](IpList &ips) {
            ScanProgress during = progress_for(kKey);
            EXPECT_EQ(during.status, ScanStatus::RUNNING);
            EXPECT_EQ(during.phase, ScanPhase::RECONCILING);
            ips = {"10.0.0.1"};
            return true;
        }));
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2"}));
    EXPECT_CALL(*adapter, add_discovery_ips(IpList{"10.0.0.2", "192.168.1.1", "192.168.1.2"}))
        .WillOnce(Return(true));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{{"192.168.1.0/30"}, {}, 1024}, kKey);

    ASSERT_TRUE(summary.ok) << summary.error;
    ScanProgress p = progress_for(kKey);
    EXPECT_EQ(p.status, ScanStatus::DONE);
    EXPECT_EQ(p.items_processed, 2);
    EXPECT_EQ(p.count.value_or(-1), 4);
}

TEST_F(ReconcilerTest, ReconcileFetchFailureAfterGatherRecordsError) {
    EXPECT_CALL(*adapter, get_discovery_ips(_))
        .WillOnce(DoAll(SetArgReferee<0>(IpList{"10.0.0.1", "10.0.0.2"}), Return(true)))
        .WillOnce(Return(false));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{}, kKey);

    EXPECT_FALSE(summary.ok);
    EXPECT_THAT(summary.error, HasSubstr("remote discovery fetch failed"));
    ScanProgress p = progress_for(kKey);
    EXPECT_EQ(p.status, ScanStatus::ERROR);
    EXPECT_THAT(p.error.value_or(""), HasSubstr("vendor said no"));
    EXPECT_FALSE(p.count.has_value());
}

TEST_F(ReconcilerTest, CancelledAfterGatherRecordsError) {
    CancellationToken token;
    EXPECT_CALL(*adapter, get_discovery_ips(_))
        .WillOnce(DoAll(SetArgReferee<0>(IpList{"10.0.0.1"}), Return(true)))
        .WillOnce(Invoke([&token](IpList &ips) {
            token.cancel();
            ips = {"10.0.0.9"};
            return true;
        }));

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{}, kKey, &token);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_TRUE(summary.added.empty());
    EXPECT_TRUE(summary.removed.empty());
    ScanProgress p = progress_for(kKey);
    EXPECT_EQ(p.status, ScanStatus::ERROR);
    EXPECT_EQ(p.error.value_or(""), "cancelled");
}

TEST_F(ReconcilerTest, RunForUnknownVendorFails) {
    ReconcileSummary summary = reconciler->run("nobody", ScanOptions{});
    EXPECT_FALSE(summary.ok);
    EXPECT_THAT(summary.error, HasSubstr("unknown vendor"));
}

TEST_F(ReconcilerTest, CancelledBeforeStartMakesNoVendorCalls) {
    CancellationToken token;
    token.cancel();

    ReconcileSummary summary = reconciler->run("shure-main", ScanOptions{}, kKey, &token);

    EXPECT_FALSE(summary.ok);
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(progress_for(kKey).status, ScanStatus::ERROR);
}

TEST_F(ReconcilerTest, CancelledMidScanRecordsError) {
    remote_lists({{}});
    dns["a.example.com"] = {"10.0.0.1"};
    dns["b.example.com"] = {"10.0.0.2"};

    CancellationToken token;
    on_resolve = [&token](const std::string &) { token.cancel(); };

    ScanOptions opts{{}, {"a.example.com", "b.example.com"}, 1024};
    ReconcileSummary summary = reconciler->run("shure-main", opts, kKey, &token);

    EXPECT_TRUE(summary.cancelled);
    ScanProgress p = progress_for(kKey);
    EXPECT_EQ(p.status, ScanStatus::ERROR);
    EXPECT_EQ(p.error.value_or(""), "cancelled");
    EXPECT_EQ(p.items_processed, 1);
}

TEST_F(ReconcilerTest, RunPublishesCompletedEvent) {
    auto sub = emitter->subscribe();
    ASSERT_NE(sub, nullptr);

    remote_lists({{}, {}});
    ON_CALL(devices, ips_for_vendor("shure-main")).WillByDefault(Return(IpList{"10.0.0.2"}));
    EXPECT_CALL(*adapter, add_discovery_ips(_)).WillOnce(Return(true));

    reconciler->run("shure-main", ScanOptions{});

    auto received = sub->pop(1000);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(std::holds_alternative<events::ReconcileCompletedEvent>(*received));
    const auto &evt = std::get<events::ReconcileCompletedEvent>(*received);
    EXPECT_EQ(evt.vendor_id, "shure-main");
    EXPECT_TRUE(evt.ok);
    EXPECT_EQ(evt.added, 1u);
    EXPECT_EQ(evt.removed, 0u);
    EXPECT_GT(evt.event_id, 0u);
}
