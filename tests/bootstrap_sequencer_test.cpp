#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ioc/bootstrap_sequencer.hpp"
#include "ioc/utility_registry.hpp"

namespace {

using namespace std::chrono_literals;
using ioc::FailureReason;
using ioc::UtilityDescriptor;
using ioc::UtilityState;

struct Journal {
    std::mutex mutex;
    std::vector<std::string> built;
    std::vector<std::string> released;

    void add(std::vector<std::string>& into, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        into.push_back(name);
    }
};

class RecordedUtility : public ioc::Utility {
public:
    RecordedUtility(std::string name, std::shared_ptr<Journal> journal) : name_(std::move(name)), journal_(std::move(journal)) {}

    std::string name() const override { return name_; }
    Result<void> shutdown() override {
        journal_->add(journal_->released, name_);
        return OK();
    }

private:
    std::string name_;
    std::shared_ptr<Journal> journal_;
};

class FailingShutdown : public ioc::Utility {
public:
    std::string name() const override { return "failing"; }
    Result<void> shutdown() override { return Error(ResultCode::InternalError, "flush failed"); }
};

class SlowShutdown : public ioc::Utility {
public:
    std::string name() const override { return "slow"; }
    Result<void> shutdown() override {
        std::this_thread::sleep_for(300ms);
        return OK();
    }
};

class BootstrapSequencerTest : public ::testing::Test {
protected:
    UtilityDescriptor healthy(const std::string& name, std::vector<std::string> deps = {})
    {
        UtilityDescriptor d;
        d.name = name;
        d.dependencies = std::move(deps);
        auto journal = journal_;
        d.factory = [journal, name](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
            journal->add(journal->built, name);
            return Result<ioc::UtilityHandle>::OK(std::make_shared<RecordedUtility>(name, journal));
        };
        return d;
    }

    UtilityDescriptor failing(const std::string& name, std::vector<std::string> deps = {})
    {
        auto d = healthy(name, std::move(deps));
        d.factory = [](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
            return Result<ioc::UtilityHandle>::Error(ResultCode::NetworkError, "exporter unreachable");
        };
        return d;
    }

    ioc::BootstrapResult run(const std::vector<UtilityDescriptor>& descriptors,
                             task::Deadline deadline = task::noDeadline())
    {
        auto result = sequencer_.bootstrap(descriptors, snapshot_, deadline);
        EXPECT_TRUE(result) << to_string(result);
        return result.value();
    }

    static void expectReadyClosure(const std::vector<UtilityDescriptor>& descriptors,
                                   const ioc::BootstrapResult& result)
    {
        for (const auto& d : descriptors) {
            if (!result.states.at(d.name).ready()) continue;
            EXPECT_TRUE(result.registry->contains(d.name));
            for (const auto& dep : d.dependencies) {
                EXPECT_TRUE(result.states.at(dep).ready()) << d.name << " is Ready but " << dep << " is not";
            }
        }
    }

    std::shared_ptr<Journal> journal_ = std::make_shared<Journal>();
    config::ConfigurationSnapshot snapshot_{"svc", {{"LOG_LEVEL", "debug"}, {"CACHE_TTL", "30"}, {"OTHER", "x"}}};
    ioc::BootstrapSequencer sequencer_;
};

TEST_F(BootstrapSequencerTest, OrdersByDependenciesThenDeclaration)
{
    auto order = ioc::BootstrapSequencer::order({
        healthy("tenant", {"logger", "config"}),
        healthy("health", {"logger"}),
        healthy("logger", {"config"}),
        healthy("config"),
    });
    ASSERT_TRUE(order);
    EXPECT_EQ(order.value(), (std::vector<std::string>{"config", "logger", "tenant", "health"}));
}

TEST_F(BootstrapSequencerTest, EveryReadyUtilityHasReadyDependencies)
{
    const std::vector<std::vector<UtilityDescriptor>> graphs = {
        {healthy("a"), healthy("b", {"a"}), healthy("c", {"a", "b"}), failing("d", {"c"}), healthy("e", {"d"})},
        {failing("a"), healthy("b", {"a"}), healthy("c"), healthy("d", {"c", "b"})},
        {healthy("a"), healthy("b"), failing("c", {"a"}), healthy("d", {"b"}), healthy("e", {"c", "d"})},
    };
    for (const auto& graph : graphs) {
        expectReadyClosure(graph, run(graph));
    }
}

TEST_F(BootstrapSequencerTest, CycleConstructsNothing)
{
    auto result = sequencer_.bootstrap({
        healthy("config"),
        healthy("a", {"config", "c"}),
        healthy("b", {"a"}),
        healthy("c", {"b"}),
    }, snapshot_);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ResultCode::CyclicDependency);
    ASSERT_TRUE(result.error().has_value());
    EXPECT_NE(result.error()->find("a"), std::string::npos);
    EXPECT_TRUE(journal_->built.empty());
}

TEST_F(BootstrapSequencerTest, SelfDependencyIsACycle)
{
    auto order = ioc::BootstrapSequencer::order({healthy("a", {"a"})});
    ASSERT_FALSE(order);
    EXPECT_EQ(order.code(), ResultCode::CyclicDependency);
}

TEST_F(BootstrapSequencerTest, DuplicateNamesAreRejected)
{
    auto order = ioc::BootstrapSequencer::order({healthy("a"), healthy("a")});
    ASSERT_FALSE(order);
    EXPECT_EQ(order.code(), ResultCode::InvalidArgument);
}

TEST_F(BootstrapSequencerTest, FailureOnlyTakesDownDependents)
{
    auto result = run({
        healthy("config"),
        failing("telemetry", {"config"}),
        healthy("exporter", {"telemetry"}),
        healthy("dashboard", {"exporter"}),
        healthy("logger", {"config"}),
    });

    EXPECT_EQ(result.states.at("telemetry").state, UtilityState::Failed);
    EXPECT_EQ(result.states.at("telemetry").reason, FailureReason::ConstructorFailed);
    EXPECT_EQ(result.states.at("exporter").reason, FailureReason::DependencyFailed);
    EXPECT_EQ(result.states.at("dashboard").reason, FailureReason::DependencyFailed);
    EXPECT_TRUE(result.states.at("logger").ready());
    EXPECT_TRUE(result.states.at("config").ready());

    EXPECT_EQ(result.registry->size(), 2u);
    EXPECT_TRUE(result.registry->frozen());
    EXPECT_TRUE(result.degraded());
    EXPECT_EQ(result.failed(), (std::vector<std::string>{"telemetry", "exporter", "dashboard"}));
}

TEST_F(BootstrapSequencerTest, UndeclaredDependencyIsMissing)
{
    auto result = run({healthy("a", {"ghost"}), healthy("b", {"a"}), healthy("c")});

    EXPECT_EQ(result.states.at("a").reason, FailureReason::MissingDependency);
    EXPECT_EQ(result.states.at("b").reason, FailureReason::DependencyFailed);
    EXPECT_TRUE(result.states.at("c").ready());
}

TEST_F(BootstrapSequencerTest, ThrowingFactoryFailsItsUtility)
{
    auto thrower = healthy("thrower");
    thrower.factory = [](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
        throw std::runtime_error("boom");
    };
    auto nothing = healthy("nothing");
    nothing.factory = [](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
        return Result<ioc::UtilityHandle>::OK(nullptr);
    };

    auto result = run({thrower, nothing, healthy("other")});
    EXPECT_EQ(result.states.at("thrower").reason, FailureReason::ConstructorFailed);
    EXPECT_NE(result.states.at("thrower").detail.find("boom"), std::string::npos);
    EXPECT_EQ(result.states.at("nothing").reason, FailureReason::ConstructorFailed);
    EXPECT_TRUE(result.states.at("other").ready());
}

TEST_F(BootstrapSequencerTest, FactorySeesOnlyItsSliceAndDependencies)
{
    std::shared_ptr<ioc::UtilityContext> seen;
    auto cache = healthy("cache", {"config"});
    cache.config_keys = {config::optionalKey("CACHE_TTL", config::ValueType::Int)};
    auto journal = journal_;
    cache.factory = [&seen, journal](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        seen = std::make_shared<ioc::UtilityContext>(ctx);
        return Result<ioc::UtilityHandle>::OK(std::make_shared<RecordedUtility>("cache", journal));
    };

    run({healthy("config"), healthy("unrelated"), cache});

    ASSERT_TRUE(seen);
    EXPECT_EQ(seen->serviceName(), "svc");
    EXPECT_TRUE(seen->config().contains("CACHE_TTL"));
    EXPECT_FALSE(seen->config().contains("OTHER"));
    EXPECT_TRUE(seen->dependency("config"));
    EXPECT_FALSE(seen->dependency("unrelated"));
}

TEST_F(BootstrapSequencerTest, BadConfigurationFailsWithConfigError)
{
    auto strict = healthy("registry_client");
    strict.config_keys = {config::requiredKey("SERVICE_REGISTRY_URL")};
    auto typed = healthy("cache");
    typed.config_keys = {config::optionalKey("OTHER", config::ValueType::Int)};

    auto result = run({strict, typed, healthy("user", {"registry_client"}), healthy("logger")});
    EXPECT_EQ(result.states.at("registry_client").reason, FailureReason::ConfigError);
    EXPECT_EQ(result.states.at("cache").reason, FailureReason::ConfigError);
    EXPECT_EQ(result.states.at("user").reason, FailureReason::DependencyFailed);
    EXPECT_TRUE(result.states.at("logger").ready());
}

TEST_F(BootstrapSequencerTest, DeadlineMarksRemainingUtilitiesTimeout)
{
    auto slow = healthy("slow");
    slow.factory = [](const ioc::UtilityContext&) -> Result<ioc::UtilityHandle> {
        std::this_thread::sleep_for(300ms);
        return Result<ioc::UtilityHandle>::Error(ResultCode::Fail, "too late");
    };

    auto result = run({healthy("first"), slow, healthy("after"), healthy("dependent", {"slow"})},
                      task::deadlineAfter(100ms));

    EXPECT_TRUE(result.states.at("first").ready());
    EXPECT_EQ(result.states.at("slow").reason, FailureReason::Timeout);
    EXPECT_EQ(result.states.at("after").reason, FailureReason::Timeout);
    EXPECT_EQ(result.states.at("dependent").reason, FailureReason::Timeout);
}

// -------------------------------
// UtilityRegistry
// -------------------------------

class UtilityRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<Journal> journal_ = std::make_shared<Journal>();
    ioc::UtilityRegistry registry_;
};

TEST_F(UtilityRegistryTest, AddRejectsNullDuplicateAndFrozen)
{
    EXPECT_TRUE(registry_.add("a", std::make_shared<RecordedUtility>("a", journal_)));
    EXPECT_FALSE(registry_.add("a", std::make_shared<RecordedUtility>("a", journal_)));
    EXPECT_FALSE(registry_.add("b", nullptr));

    registry_.freeze();
    EXPECT_FALSE(registry_.add("c", std::make_shared<RecordedUtility>("c", journal_)));
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_TRUE(registry_.find<RecordedUtility>("a"));
    EXPECT_FALSE(registry_.find("c"));
}

TEST_F(UtilityRegistryTest, ReleasesInReverseOrderOnce)
{
    for (const auto* name : {"config", "logger", "tenant"}) {
        ASSERT_TRUE(registry_.add(name, std::make_shared<RecordedUtility>(name, journal_)));
    }
    registry_.freeze();

    EXPECT_EQ(registry_.names(), (std::vector<std::string>{"config", "logger", "tenant"}));
    EXPECT_EQ(registry_.releaseAll(1s), 0u);
    EXPECT_EQ(registry_.releaseAll(1s), 0u);
    EXPECT_EQ(journal_->released, (std::vector<std::string>{"tenant", "logger", "config"}));

    // handles stay resolvable until the registry goes away
    EXPECT_TRUE(registry_.contains("logger"));
}

TEST_F(UtilityRegistryTest, TeardownErrorsAreCountedNotPropagated)
{
    registry_.add("a", std::make_shared<RecordedUtility>("a", journal_));
    registry_.add("failing", std::make_shared<FailingShutdown>());
    registry_.add("slow", std::make_shared<SlowShutdown>());
    registry_.freeze();

    EXPECT_EQ(registry_.releaseAll(50ms), 2u);
    EXPECT_EQ(journal_->released, (std::vector<std::string>{"a"}));
}

} // namespace
