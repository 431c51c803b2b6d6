#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ioc/ioc.hpp"
#include "utilities/standard_utilities.hpp"

namespace {

using namespace std::chrono_literals;
using ioc::ContainerState;
using ioc::DIContainer;
using ioc::FailureReason;

struct Releases {
    std::atomic<int> count{0};
    std::atomic<bool> guard_released{false};
    std::atomic<bool> released_after_guard{false};
};

class Counted : public ioc::Utility {
public:
    explicit Counted(std::shared_ptr<Releases> releases) : releases_(std::move(releases)) {}

    std::string name() const override { return "counted"; }
    Result<void> shutdown() override {
        releases_->released_after_guard = releases_->guard_released.load();
        ++releases_->count;
        return OK();
    }

private:
    std::shared_ptr<Releases> releases_;
};

ioc::UtilityDescriptor countedDescriptor(std::shared_ptr<Releases> releases)
{
    ioc::UtilityDescriptor d;
    d.name = "counted";
    d.factory = [releases](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
        return Result<ioc::UtilityHandle>::OK(std::make_shared<Counted>(releases));
    };
    return d;
}

class ThrowingTelemetrySink : public utilities::TelemetrySink {
public:
    std::string name() const override { return "throwing"; }
    Result<void> emit(const utilities::TelemetryEvent&) override { throw std::runtime_error("collector down"); }
};

class ThrowingHealthSink : public utilities::HealthSink {
public:
    Result<void> publish(const utilities::HealthReport&) override { throw 7; }
};

// Records its lifecycle; stopped_before_release tells whether the utilities
// were still alive when the container stopped it.
class RecordingService : public ioc::ManagedService {
public:
    RecordingService(std::string name, std::string type, std::string realm,
                     std::shared_ptr<Releases> releases, bool fail_start = false)
        : name_(std::move(name)), type_(std::move(type)), realm_(std::move(realm)),
          releases_(std::move(releases)), fail_start_(fail_start) {}

    std::string serviceName() const override { return name_; }
    std::string serviceType() const override { return type_; }
    std::string realm() const override { return realm_; }

    Result<void> startService() override {
        ++starts;
        if (fail_start_) {
            state_ = ioc::ServiceState::Failed;
            return Error(ResultCode::ConnectionFail, "backend unreachable");
        }
        state_ = ioc::ServiceState::Running;
        return OK();
    }
    Result<void> stopService() override {
        ++stops;
        stopped_before_release = releases_->count.load() == 0;
        state_ = ioc::ServiceState::Stopped;
        return OK();
    }
    ioc::ServiceHealth serviceHealth() const override { return {state_.load(), ""}; }

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<bool> stopped_before_release{false};

private:
    std::string name_;
    std::string type_;
    std::string realm_;
    std::shared_ptr<Releases> releases_;
    bool fail_start_;
    std::atomic<ioc::ServiceState> state_{ioc::ServiceState::Created};
};

class DIContainerTest : public ::testing::Test {
protected:
    std::shared_ptr<Releases> releases_ = std::make_shared<Releases>();

    std::shared_ptr<RecordingService> service(const std::string& name, const std::string& type = "agent",
                                              const std::string& realm = "default", bool fail_start = false)
    {
        return std::make_shared<RecordingService>(name, type, realm, releases_, fail_start);
    }
};

TEST_F(DIContainerTest, StandardSetBootsAndRuns)
{
    DIContainer container;
    auto init = container.initialize("billing");
    ASSERT_TRUE(init) << to_string(init);

    EXPECT_EQ(init->generation, 1u);
    EXPECT_TRUE(init->degraded.empty());
    EXPECT_EQ(container.state(), ContainerState::Running);
    EXPECT_EQ(container.serviceName(), "billing");

    auto summary = container.summary();
    EXPECT_EQ(summary.ready.size(), 9u);
    EXPECT_TRUE(summary.failed.empty());

    auto logger = container.getUtility<utilities::LoggerUtility>("logger");
    ASSERT_TRUE(logger);
    EXPECT_EQ(logger.value()->tag(), "billing");

    auto telemetry = ioc::tryGetUtility<utilities::TelemetryUtility>(container, "telemetry");
    ASSERT_TRUE(telemetry);
    EXPECT_GE(telemetry->emitted(), 1u);

    auto health = ioc::tryGetUtility<utilities::HealthUtility>(container, "health");
    ASSERT_TRUE(health);
    EXPECT_TRUE(health->healthy());

    ASSERT_TRUE(container.configuration());
    EXPECT_EQ(container.configuration()->serviceName(), "billing");
}

TEST_F(DIContainerTest, FailingTelemetryLeavesServiceDegraded)
{
    DIContainer container({
        utilities::ConfigUtility::descriptor(),
        utilities::LoggerUtility::descriptor(),
        utilities::HealthUtility::descriptor(),
        utilities::TelemetryUtility::descriptor(),
    });
    // the http exporter needs TELEMETRY_ENDPOINT
    auto init = container.initialize("billing", {{"TELEMETRY_EXPORTER", "http"}});
    ASSERT_TRUE(init) << to_string(init);
    EXPECT_EQ(init->degraded, (std::vector<std::string>{"telemetry"}));
    EXPECT_EQ(container.state(), ContainerState::Degraded);

    EXPECT_TRUE(container.getUtility("logger"));

    auto telemetry = container.getUtility("telemetry");
    ASSERT_FALSE(telemetry);
    EXPECT_EQ(telemetry.code(), ResultCode::UtilityUnavailable);

    auto summary = container.healthSummary();
    EXPECT_TRUE(summary.at("telemetry").failed());
    EXPECT_EQ(summary.at("telemetry").reason, FailureReason::ConstructorFailed);
    EXPECT_TRUE(summary.at("logger").ready());

    auto health = ioc::tryGetUtility<utilities::HealthUtility>(container, "health");
    ASSERT_TRUE(health);
    ASSERT_TRUE(health->status("telemetry"));
    EXPECT_TRUE(health->status("telemetry")->failed());
    EXPECT_FALSE(health->healthy());
}

TEST_F(DIContainerTest, UnknownOrWrongTypeIsUnavailable)
{
    DIContainer container;
    ASSERT_TRUE(container.initialize("svc"));

    EXPECT_EQ(container.getUtility("cache").code(), ResultCode::UtilityUnavailable);
    EXPECT_EQ(container.getUtility<utilities::TenantUtility>("logger").code(), ResultCode::UtilityUnavailable);
    EXPECT_FALSE(ioc::tryGetUtility<utilities::TenantUtility>(container, "logger"));
}

TEST_F(DIContainerTest, NothingResolvesBeforeInitialize)
{
    DIContainer container;
    EXPECT_EQ(container.state(), ContainerState::Created);
    EXPECT_EQ(container.getUtility("config").code(), ResultCode::UtilityUnavailable);
    EXPECT_TRUE(container.healthSummary().empty());
    EXPECT_FALSE(container.configuration());
}

TEST_F(DIContainerTest, ConfigurationErrorStopsInitialize)
{
    DIContainer container;
    container.loader().requireKey(config::requiredKey("SERVICE_REGISTRY_URL"));

    auto init = container.initialize("svc");
    ASSERT_FALSE(init);
    EXPECT_EQ(init.code(), ResultCode::ConfigMissingRequired);
    EXPECT_EQ(container.state(), ContainerState::Stopped);
    EXPECT_FALSE(container.getUtility("config"));
}

TEST_F(DIContainerTest, CycleIsRejected)
{
    ioc::UtilityDescriptor a = countedDescriptor(releases_);
    a.dependencies = {"b"};
    ioc::UtilityDescriptor b = countedDescriptor(releases_);
    b.name = "b";
    b.dependencies = {"counted"};

    DIContainer container({a, b});
    auto init = container.initialize("svc");
    ASSERT_FALSE(init);
    EXPECT_EQ(init.code(), ResultCode::CyclicDependency);
}

TEST_F(DIContainerTest, EmptyServiceNameIsInvalid)
{
    DIContainer container;
    EXPECT_EQ(container.initialize("").code(), ResultCode::InvalidArgument);
}

TEST_F(DIContainerTest, ShutdownIsIdempotent)
{
    DIContainer container({countedDescriptor(releases_)});
    ASSERT_TRUE(container.initialize("svc"));

    container.shutdown();
    container.shutdown();

    EXPECT_EQ(container.state(), ContainerState::Stopped);
    EXPECT_EQ(releases_->count.load(), 1);
    EXPECT_EQ(container.getUtility("counted").code(), ResultCode::UtilityUnavailable);
    EXPECT_FALSE(container.enter());
}

TEST_F(DIContainerTest, ReinitializeReleasesPreviousGeneration)
{
    DIContainer container({countedDescriptor(releases_)});
    ASSERT_TRUE(container.initialize("svc"));
    auto first = container.getUtility("counted").value();

    auto second_init = container.initialize("svc", {{"LOG_LEVEL", "debug"}});
    ASSERT_TRUE(second_init);
    EXPECT_EQ(second_init->generation, 2u);
    EXPECT_EQ(releases_->count.load(), 1);

    auto second = container.getUtility("counted").value();
    EXPECT_NE(first, second);
    EXPECT_EQ(container.configuration()->getString("LOG_LEVEL", ""), "debug");
}

TEST_F(DIContainerTest, ShutdownWaitsForInFlightCalls)
{
    ioc::ContainerOptions options;
    options.drain_grace = 5s;
    DIContainer container({countedDescriptor(releases_)}, options);
    ASSERT_TRUE(container.initialize("svc"));

    std::atomic<bool> entered{false};
    std::thread caller([&] {
        auto guard = container.enter();
        entered = static_cast<bool>(guard);
        std::this_thread::sleep_for(200ms);
        releases_->guard_released = true;
    });
    while (!entered) std::this_thread::sleep_for(1ms);

    container.shutdown();
    caller.join();

    EXPECT_EQ(container.inFlight(), 0u);
    EXPECT_TRUE(releases_->released_after_guard.load());
}

TEST_F(DIContainerTest, DrainGiveUpAfterGracePeriod)
{
    ioc::ContainerOptions options;
    options.drain_grace = 100ms;
    DIContainer container({countedDescriptor(releases_)}, options);
    ASSERT_TRUE(container.initialize("svc"));

    auto guard = container.enter();
    ASSERT_TRUE(guard);

    const auto started = std::chrono::steady_clock::now();
    container.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(releases_->count.load(), 1);
    EXPECT_EQ(container.inFlight(), 1u);
}

TEST_F(DIContainerTest, InitDeadlineFailsSlowUtilities)
{
    ioc::UtilityDescriptor slow;
    slow.name = "slow";
    slow.factory = [](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
        std::this_thread::sleep_for(400ms);
        return Result<ioc::UtilityHandle>::Error(ResultCode::Fail, "too late");
    };

    ioc::ContainerOptions options;
    options.init_timeout = 100ms;
    DIContainer container({utilities::ConfigUtility::descriptor(), slow}, options);

    auto init = container.initialize("svc");
    ASSERT_TRUE(init);
    EXPECT_EQ(init->states.at("slow").reason, FailureReason::Timeout);
    EXPECT_TRUE(init->states.at("config").ready());
    EXPECT_EQ(container.state(), ContainerState::Degraded);
}

TEST_F(DIContainerTest, ContainersAreIndependent)
{
    DIContainer a;
    DIContainer b;
    ASSERT_TRUE(a.initialize("a"));
    ASSERT_TRUE(b.initialize("b"));

    a.shutdown();
    EXPECT_TRUE(b.getUtility("tenant"));
    EXPECT_EQ(b.serviceName(), "b");
}

TEST_F(DIContainerTest, ThrowingSinksDoNotBreakInitialize)
{
    utilities::StandardOptions options;
    options.telemetry_sink = std::make_shared<ThrowingTelemetrySink>();
    options.health_sink = std::make_shared<ThrowingHealthSink>();
    DIContainer container(utilities::standardDescriptors(options));

    auto init = container.initialize("billing");
    ASSERT_TRUE(init) << to_string(init);
    EXPECT_TRUE(init->degraded.empty());
    EXPECT_EQ(container.state(), ContainerState::Running);

    auto telemetry = ioc::tryGetUtility<utilities::TelemetryUtility>(container, "telemetry");
    ASSERT_TRUE(telemetry);
    EXPECT_GE(telemetry->dropped(), 1u);
    EXPECT_EQ(telemetry->emitted(), 0u);

    auto health = ioc::tryGetUtility<utilities::HealthUtility>(container, "health");
    ASSERT_TRUE(health);
    EXPECT_GE(health->publishFailures(), 9u);
    EXPECT_TRUE(health->healthy());

    container.shutdown();
    EXPECT_EQ(container.state(), ContainerState::Stopped);
}

TEST_F(DIContainerTest, ServicesAreFoundByNameTypeAndRealm)
{
    DIContainer container({countedDescriptor(releases_)});
    ASSERT_TRUE(container.registerService(service("billing", "agent", "finance")));
    ASSERT_TRUE(container.registerService(service("ledger", "manager", "finance")));
    ASSERT_TRUE(container.registerService(service("mailer", "agent", "comms")));

    auto found = container.getService("ledger");
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value()->serviceType(), "manager");
    EXPECT_EQ(container.getService("nope").code(), ResultCode::NotFound);

    EXPECT_EQ(container.servicesByType("agent").size(), 2u);
    EXPECT_EQ(container.servicesByRealm("finance").size(), 2u);
    EXPECT_TRUE(container.servicesByRealm("ops").empty());
    EXPECT_EQ(container.serviceNames(), (std::vector<std::string>{"billing", "ledger", "mailer"}));
}

TEST_F(DIContainerTest, RegistrationRejectsDuplicatesAndBlanks)
{
    DIContainer container({countedDescriptor(releases_)});
    ASSERT_TRUE(container.registerService(service("billing")));

    EXPECT_EQ(container.registerService(service("billing")).code(), ResultCode::AlreadyExists);
    EXPECT_EQ(container.registerService(service("")).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(container.registerService(nullptr).code(), ResultCode::InvalidArgument);
    EXPECT_EQ(container.serviceNames().size(), 1u);
}

TEST_F(DIContainerTest, ServicesStartOnlyOnceRunning)
{
    DIContainer container({countedDescriptor(releases_)});
    auto billing = service("billing");
    ASSERT_TRUE(container.registerService(billing));

    EXPECT_EQ(container.startAllServices().code(), ResultCode::InvalidState);
    EXPECT_EQ(billing->starts.load(), 0);

    ASSERT_TRUE(container.initialize("svc"));
    ASSERT_TRUE(container.startAllServices());
    EXPECT_EQ(billing->starts.load(), 1);
    EXPECT_EQ(billing->serviceHealth().state, ioc::ServiceState::Running);
}

TEST_F(DIContainerTest, FailingServiceDoesNotBlockTheOthers)
{
    DIContainer container({countedDescriptor(releases_)});
    auto broken = service("broken", "agent", "default", true);
    auto billing = service("billing");
    ASSERT_TRUE(container.registerService(broken));
    ASSERT_TRUE(container.registerService(billing));
    ASSERT_TRUE(container.initialize("svc"));

    auto started = container.startAllServices();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.code(), ResultCode::ConnectionFail);
    EXPECT_EQ(billing->serviceHealth().state, ioc::ServiceState::Running);

    auto health = container.aggregatedHealth();
    EXPECT_FALSE(health.healthy);
    EXPECT_EQ(health.services.at("broken").state, ioc::ServiceState::Failed);
    EXPECT_TRUE(health.services.at("billing").running());
}

TEST_F(DIContainerTest, ShutdownStopsServicesBeforeReleasingUtilities)
{
    DIContainer container({countedDescriptor(releases_)});
    auto billing = service("billing");
    ASSERT_TRUE(container.registerService(billing));
    ASSERT_TRUE(container.initialize("svc"));
    ASSERT_TRUE(container.startAllServices());

    container.shutdown();
    EXPECT_EQ(billing->stops.load(), 1);
    EXPECT_TRUE(billing->stopped_before_release.load());
    EXPECT_EQ(releases_->count.load(), 1);

    container.shutdown();
    EXPECT_EQ(billing->stops.load(), 1);
    EXPECT_TRUE(container.getService("billing"));
}

TEST_F(DIContainerTest, ReinitializeStopsRunningServices)
{
    DIContainer container({countedDescriptor(releases_)});
    auto billing = service("billing");
    ASSERT_TRUE(container.registerService(billing));
    ASSERT_TRUE(container.initialize("svc"));
    ASSERT_TRUE(container.startAllServices());

    ASSERT_TRUE(container.initialize("svc"));
    EXPECT_EQ(billing->stops.load(), 1);
    EXPECT_TRUE(billing->stopped_before_release.load());

    ASSERT_TRUE(container.startAllServices());
    EXPECT_EQ(billing->starts.load(), 2);
}

TEST_F(DIContainerTest, AggregatedHealthCoversUtilitiesAndServices)
{
    DIContainer container({countedDescriptor(releases_)});
    auto billing = service("billing");
    ASSERT_TRUE(container.registerService(billing));

    auto before = container.aggregatedHealth();
    EXPECT_EQ(before.container, ContainerState::Created);
    EXPECT_FALSE(before.healthy);

    ASSERT_TRUE(container.initialize("svc"));
    auto booted = container.aggregatedHealth();
    EXPECT_TRUE(booted.utilities.at("counted").ready());
    EXPECT_EQ(booted.services.at("billing").state, ioc::ServiceState::Created);
    EXPECT_FALSE(booted.healthy);

    ASSERT_TRUE(container.startAllServices());
    auto running = container.aggregatedHealth();
    EXPECT_EQ(running.container, ContainerState::Running);
    EXPECT_TRUE(running.healthy);

    container.shutdown();
    auto stopped = container.aggregatedHealth();
    EXPECT_EQ(stopped.services.at("billing").state, ioc::ServiceState::Stopped);
    EXPECT_FALSE(stopped.healthy);
}

} // namespace
