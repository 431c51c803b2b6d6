#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ioc/ioc.hpp"
#include "tenancy/in_memory_tenant_store.hpp"
#include "tenancy/tenant_protocol_enforcer.hpp"
#include "utilities/standard_utilities.hpp"

namespace {

using security::SecurityContext;
using tenancy::CallState;
using tenancy::TenantPatch;
using tenancy::TenantSpec;
using tenancy::TenantStatus;

SecurityContext user(const std::string& id)
{
    SecurityContext ctx;
    ctx.user_id = id;
    return ctx;
}

SecurityContext platformAdmin()
{
    SecurityContext ctx;
    ctx.user_id = "root";
    ctx.roles = {"platform_admin"};
    return ctx;
}

// Audit writes fail, everything else works.
class BrokenAuditStore : public tenancy::InMemoryTenantStore {
public:
    explicit BrokenAuditStore(bool throws) : throws_(throws) {}

    Result<void> appendAudit(tenancy::AuditRecord) override {
        if (throws_) throw std::runtime_error("audit table locked");
        return Error(ResultCode::InternalError, "disk full");
    }

private:
    bool throws_;
};

class DenyDeletes : public security::PolicyEngine {
public:
    Result<void> enforce(const SecurityContext&, const std::string& action, const std::string&) override {
        if (action == "tenant.delete") return Error(ResultCode::AccessDenied, "deletes are frozen");
        return OK();
    }
};

class ThrowingTelemetrySink : public utilities::TelemetrySink {
public:
    std::string name() const override { return "throwing"; }
    Result<void> emit(const utilities::TelemetryEvent&) override { throw std::runtime_error("collector down"); }
};

class ThrowingHealthSink : public utilities::HealthSink {
public:
    Result<void> publish(const utilities::HealthReport&) override { throw std::runtime_error("bus down"); }
};

TenantSpec spec(const std::string& id)
{
    TenantSpec out;
    out.tenant_id = id;
    out.name = "Tenant " + id;
    out.admin_user_id = "owner";
    return out;
}

class TenantProtocolTest : public ::testing::Test {
protected:
    void SetUp() override { start({}); }

    void start(utilities::StandardOptions options, const config::Values& overrides = {})
    {
        enforcer_.reset();
        container_ = std::make_unique<ioc::DIContainer>(utilities::standardDescriptors(options));
        auto init = container_->initialize("tenant-svc", overrides);
        ASSERT_TRUE(init) << to_string(init);
        ASSERT_TRUE(init->degraded.empty());
        enforcer_ = std::make_unique<tenancy::TenantProtocolEnforcer>(*container_);
    }

    tenancy::Tenant createAcme(int64_t max_users = 0)
    {
        TenantSpec spec;
        spec.tenant_id = "acme";
        spec.name = "Acme Corp";
        spec.admin_user_id = "owner";
        spec.admin_email = "owner@acme.io";
        spec.max_users = max_users;
        auto created = enforcer_->createTenant(platformAdmin(), spec);
        EXPECT_TRUE(created) << to_string(created);
        return created.value();
    }

    std::shared_ptr<utilities::TelemetryUtility> telemetry() const
    {
        return ioc::tryGetUtility<utilities::TelemetryUtility>(*container_, "telemetry");
    }

    std::unique_ptr<ioc::DIContainer> container_;
    std::unique_ptr<tenancy::TenantProtocolEnforcer> enforcer_;
};

TEST_F(TenantProtocolTest, FeatureAccessFollowsEntitlement)
{
    createAcme();
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "alice", "admin"));

    EXPECT_FALSE(enforcer_->validateTenantFeatureAccess("acme", "beta_feature"));
    ASSERT_TRUE(enforcer_->grantTenantFeature(platformAdmin(), "acme", "beta_feature"));
    EXPECT_TRUE(enforcer_->validateTenantFeatureAccess("acme", "beta_feature"));

    ASSERT_TRUE(enforcer_->revokeTenantFeature(platformAdmin(), "acme", "beta_feature"));
    EXPECT_FALSE(enforcer_->validateTenantFeatureAccess("acme", "beta_feature"));
}

TEST_F(TenantProtocolTest, OnlyPlatformAdminsManageFeatures)
{
    createAcme();
    auto granted = enforcer_->grantTenantFeature(user("owner"), "acme", "beta_feature");
    ASSERT_FALSE(granted);
    EXPECT_EQ(granted.code(), ResultCode::AccessDenied);
    EXPECT_FALSE(enforcer_->validateTenantFeatureAccess("acme", "beta_feature"));
}

TEST_F(TenantProtocolTest, CreatorBecomesAdminMember)
{
    TenantSpec spec;
    spec.tenant_id = "solo";
    spec.name = "Solo";
    spec.type = tenancy::TenantType::Individual;

    auto created = enforcer_->createTenant(user("dana"), spec);
    ASSERT_TRUE(created) << to_string(created);
    EXPECT_EQ(created->admin_user_id, "dana");
    EXPECT_EQ(created->max_users, 50);
    EXPECT_EQ(created->status, TenantStatus::Active);

    EXPECT_TRUE(enforcer_->validateTenantAccess("dana", "solo"));
    auto users = enforcer_->getTenantUsers(user("dana"), "solo");
    ASSERT_TRUE(users);
    ASSERT_EQ(users->size(), 1u);
    EXPECT_EQ(users->front().role, "admin");
}

TEST_F(TenantProtocolTest, CreateForAnotherUserNeedsPlatformAdmin)
{
    TenantSpec spec;
    spec.tenant_id = "other";
    spec.name = "Other";
    spec.admin_user_id = "erin";

    auto created = enforcer_->createTenant(user("dana"), spec);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.code(), ResultCode::AccessDenied);

    auto context = enforcer_->getTenantContext("other");
    ASSERT_TRUE(context);
    EXPECT_FALSE(context.value());
}

TEST_F(TenantProtocolTest, DuplicateAndInvalidTenantsAreRejected)
{
    createAcme();

    TenantSpec again;
    again.tenant_id = "acme";
    again.name = "Acme again";
    EXPECT_EQ(enforcer_->createTenant(platformAdmin(), again).code(), ResultCode::DuplicateTenant);

    TenantSpec bad;
    bad.tenant_id = "no spaces allowed";
    bad.name = "Bad";
    EXPECT_EQ(enforcer_->createTenant(user("dana"), bad).code(), ResultCode::InvalidArgument);

    EXPECT_EQ(enforcer_->counters().errored, 2u);
}

TEST_F(TenantProtocolTest, UnauthenticatedCallerIsDenied)
{
    createAcme();
    auto users = enforcer_->getTenantUsers(SecurityContext{}, "acme");
    ASSERT_FALSE(users);
    EXPECT_EQ(users.code(), ResultCode::AccessDenied);
    EXPECT_FALSE(enforcer_->validateTenantAccess("", "acme"));
}

TEST_F(TenantProtocolTest, AddingTwiceKeepsOneMembershipWithLatestRole)
{
    createAcme();
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "member"));
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "viewer"));

    auto users = enforcer_->getTenantUsers(user("owner"), "acme");
    ASSERT_TRUE(users);
    const auto bobs = std::count_if(users->begin(), users->end(),
                                    [](const tenancy::TenantUser& u) { return u.user_id == "bob"; });
    EXPECT_EQ(bobs, 1);

    auto bob = std::find_if(users->begin(), users->end(),
                            [](const tenancy::TenantUser& u) { return u.user_id == "bob"; });
    ASSERT_NE(bob, users->end());
    EXPECT_EQ(bob->role, "viewer");
}

TEST_F(TenantProtocolTest, UnknownRoleIsRejected)
{
    createAcme();
    EXPECT_EQ(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "superuser").code(),
              ResultCode::InvalidArgument);
}

TEST_F(TenantProtocolTest, MemberLimitIsEnforced)
{
    createAcme(2);
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "member"));

    auto carol = enforcer_->addUserToTenant(user("owner"), "acme", "carol", "member");
    ASSERT_FALSE(carol);
    EXPECT_EQ(carol.code(), ResultCode::UserLimitExceeded);

    // role change of an existing member does not count against the limit
    EXPECT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "viewer"));

    ASSERT_TRUE(enforcer_->removeUserFromTenant(user("owner"), "acme", "bob"));
    EXPECT_FALSE(enforcer_->validateTenantAccess("bob", "acme"));
    EXPECT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "carol", "member"));

    TenantPatch shrink;
    shrink.max_users = 1;
    EXPECT_EQ(enforcer_->updateTenant(platformAdmin(), "acme", shrink).code(), ResultCode::UserLimitExceeded);
}

TEST_F(TenantProtocolTest, OnlyAdminsChangeMembership)
{
    createAcme();
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "member"));

    auto added = enforcer_->addUserToTenant(user("bob"), "acme", "mallory", "admin");
    ASSERT_FALSE(added);
    EXPECT_EQ(added.code(), ResultCode::AccessDenied);
    EXPECT_FALSE(enforcer_->validateTenantAccess("mallory", "acme"));

    auto outsider = enforcer_->getTenantUsers(user("mallory"), "acme");
    EXPECT_EQ(outsider.code(), ResultCode::AccessDenied);
    EXPECT_TRUE(enforcer_->getTenantUsers(user("bob"), "acme"));
}

TEST_F(TenantProtocolTest, SuspendedOrDeletedTenantRefusesAccess)
{
    createAcme();
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "alice", "admin"));
    ASSERT_TRUE(enforcer_->validateTenantAccess("alice", "acme"));

    TenantPatch suspend;
    suspend.status = TenantStatus::Suspended;
    ASSERT_TRUE(enforcer_->updateTenant(platformAdmin(), "acme", suspend));

    EXPECT_FALSE(enforcer_->validateTenantAccess("alice", "acme"));
    auto added = enforcer_->addUserToTenant(user("alice"), "acme", "bob", "member");
    EXPECT_EQ(added.code(), ResultCode::TenantInactive);

    // former members may still read usage of an inactive tenant
    EXPECT_TRUE(enforcer_->getTenantUsageStats(user("alice"), "acme"));

    TenantPatch reactivate;
    reactivate.status = TenantStatus::Active;
    ASSERT_TRUE(enforcer_->updateTenant(platformAdmin(), "acme", reactivate));
    EXPECT_TRUE(enforcer_->validateTenantAccess("alice", "acme"));

    ASSERT_TRUE(enforcer_->deleteTenant(user("alice"), "acme"));
    EXPECT_FALSE(enforcer_->validateTenantAccess("alice", "acme"));
}

TEST_F(TenantProtocolTest, StatusAndLimitNeedPlatformAdmin)
{
    createAcme();

    TenantPatch suspend;
    suspend.status = TenantStatus::Suspended;
    EXPECT_EQ(enforcer_->updateTenant(user("owner"), "acme", suspend).code(), ResultCode::AccessDenied);

    TenantPatch rename;
    rename.name = "Acme Industries";
    rename.metadata = {{"region", "eu"}};
    auto renamed = enforcer_->updateTenant(user("owner"), "acme", rename);
    ASSERT_TRUE(renamed);
    EXPECT_EQ(renamed->name, "Acme Industries");
    EXPECT_EQ(renamed->metadata.at("region"), "eu");

    TenantPatch drop;
    drop.metadata = {{"region", ""}};
    auto dropped = enforcer_->updateTenant(user("owner"), "acme", drop);
    ASSERT_TRUE(dropped);
    EXPECT_EQ(dropped->metadata.count("region"), 0u);
}

TEST_F(TenantProtocolTest, DeletedTenantKeepsItsHistory)
{
    createAcme();
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "alice", "member"));
    ASSERT_TRUE(enforcer_->getTenantUsers(user("alice"), "acme"));

    ASSERT_TRUE(enforcer_->deleteTenant(user("owner"), "acme"));

    auto context = enforcer_->getTenantContext("acme");
    ASSERT_TRUE(context);
    EXPECT_FALSE(context.value().has_value());

    auto stats = enforcer_->getTenantUsageStats(user("alice"), "acme");
    ASSERT_TRUE(stats) << to_string(stats);
    EXPECT_GE(stats->total_actions, 4u);
    EXPECT_EQ(stats->actions_by_type.at("tenant.delete_tenant"), 1u);
    EXPECT_TRUE(stats->last_active.has_value());

    EXPECT_TRUE(enforcer_->getTenantUsageStats(platformAdmin(), "acme"));
    EXPECT_EQ(enforcer_->getTenantUsageStats(user("stranger"), "acme").code(), ResultCode::AccessDenied);

    EXPECT_EQ(enforcer_->deleteTenant(platformAdmin(), "acme").code(), ResultCode::TenantNotFound);
    EXPECT_EQ(enforcer_->getTenantUsers(user("owner"), "acme").code(), ResultCode::TenantNotFound);
}

TEST_F(TenantProtocolTest, UsageStatsCountOutcomes)
{
    createAcme(10);
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "member"));
    EXPECT_FALSE(enforcer_->addUserToTenant(user("bob"), "acme", "eve", "member"));

    auto stats = enforcer_->getTenantUsageStats(user("owner"), "acme");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->current_users, 2u);
    EXPECT_EQ(stats->max_users, 10);
    EXPECT_DOUBLE_EQ(stats->usage_percentage, 20.0);
    EXPECT_EQ(stats->denied_actions, 1u);
    EXPECT_EQ(stats->successful_actions, 2u);
}

TEST_F(TenantProtocolTest, ListShowsOnlyVisibleTenants)
{
    createAcme();
    TenantSpec globex;
    globex.tenant_id = "globex";
    globex.name = "Globex";
    globex.type = tenancy::TenantType::Enterprise;
    ASSERT_TRUE(enforcer_->createTenant(user("hank"), globex));
    TenantSpec gone;
    gone.tenant_id = "gone";
    gone.name = "Gone";
    ASSERT_TRUE(enforcer_->createTenant(user("hank"), gone));
    ASSERT_TRUE(enforcer_->deleteTenant(user("hank"), "gone"));

    auto hank = enforcer_->listTenants(user("hank"));
    ASSERT_TRUE(hank);
    ASSERT_EQ(hank->size(), 1u);
    EXPECT_EQ(hank->front().tenant_id, "globex");

    auto all = enforcer_->listTenants(platformAdmin());
    ASSERT_TRUE(all);
    EXPECT_EQ(all->size(), 2u);

    tenancy::TenantFilter with_deleted;
    with_deleted.include_deleted = true;
    EXPECT_EQ(enforcer_->listTenants(platformAdmin(), with_deleted)->size(), 3u);
    EXPECT_EQ(enforcer_->listTenants(user("hank"), with_deleted)->size(), 1u);

    tenancy::TenantFilter enterprise;
    enterprise.type = tenancy::TenantType::Enterprise;
    auto filtered = enforcer_->listTenants(platformAdmin(), enterprise);
    ASSERT_EQ(filtered->size(), 1u);
    EXPECT_EQ(filtered->front().tenant_id, "globex");
}

TEST_F(TenantProtocolTest, TenantContextCountsActiveUsers)
{
    createAcme();
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "bob", "member"));
    ASSERT_TRUE(enforcer_->addUserToTenant(user("owner"), "acme", "carol", "member"));
    ASSERT_TRUE(enforcer_->removeUserFromTenant(user("owner"), "acme", "carol"));
    ASSERT_TRUE(enforcer_->removeUserFromTenant(user("owner"), "acme", "nobody"));

    auto context = enforcer_->getTenantContext("acme");
    ASSERT_TRUE(context);
    ASSERT_TRUE(context.value());
    EXPECT_EQ(context.value()->user_count, 2u);
    EXPECT_EQ(context.value()->tenant.name, "Acme Corp");

    EXPECT_FALSE(enforcer_->getTenantContext("missing").value());
}

TEST_F(TenantProtocolTest, AuditFailureDoesNotFailTheOperation)
{
    for (bool throws : {false, true}) {
        utilities::StandardOptions options;
        options.tenant_store = std::make_shared<BrokenAuditStore>(throws);
        start(options);

        createAcme();
        auto added = enforcer_->addUserToTenant(user("owner"), "acme", "bob", "member");
        EXPECT_TRUE(added) << to_string(added);
        EXPECT_TRUE(enforcer_->validateTenantAccess("bob", "acme"));

        enforcer_->auditTenantAction("acme", "bob", "report.export", tenancy::AuditOutcome::Success);

        const auto counters = enforcer_->counters();
        EXPECT_EQ(counters.audit_failures, 3u);
        EXPECT_EQ(counters.completed, 3u);
        EXPECT_EQ(counters.errored, 0u);
    }
}

TEST_F(TenantProtocolTest, DeniedCallsAreCountedAndNeverReachTheStore)
{
    auto store = std::make_shared<tenancy::InMemoryTenantStore>();
    utilities::StandardOptions options;
    options.tenant_store = store;
    start(options);

    createAcme();
    const auto before = store->findTenant("acme").value();

    TenantPatch rename;
    rename.name = "Hijacked";
    EXPECT_EQ(enforcer_->updateTenant(user("mallory"), "acme", rename).code(), ResultCode::AccessDenied);
    EXPECT_EQ(store->findTenant("acme")->name, before.name);
    EXPECT_EQ(store->findTenant("acme")->updated_at, before.updated_at);

    EXPECT_EQ(enforcer_->counters().denied, 1u);
    ASSERT_TRUE(telemetry());
    EXPECT_EQ(telemetry()->counterValue("tenant_protocol.denied"), 1);
    EXPECT_EQ(telemetry()->counterValue("tenant_protocol.completed"), 1);
}

TEST_F(TenantProtocolTest, PolicyEngineCanRefuse)
{
    utilities::StandardOptions options;
    options.policy_engine = std::make_shared<DenyDeletes>();
    start(options);

    createAcme();
    EXPECT_EQ(enforcer_->deleteTenant(user("owner"), "acme").code(), ResultCode::AccessDenied);
    EXPECT_TRUE(enforcer_->getTenantContext("acme").value());
}

TEST_F(TenantProtocolTest, ObserverSeesEveryTransition)
{
    createAcme();

    std::mutex mutex;
    std::vector<CallState> states;
    enforcer_->setObserver([&](const std::string& op, CallState state) {
        if (op != "get_tenant_users") return;
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    });

    ASSERT_TRUE(enforcer_->getTenantUsers(user("owner"), "acme"));
    EXPECT_EQ(states, (std::vector<CallState>{CallState::Unauthenticated, CallState::TenantResolved,
                                              CallState::AccessValidated, CallState::Delegated,
                                              CallState::Completed}));

    states.clear();
    enforcer_->getTenantUsers(user("mallory"), "acme");
    EXPECT_EQ(states, (std::vector<CallState>{CallState::Unauthenticated, CallState::TenantResolved,
                                              CallState::Denied}));
    enforcer_->setObserver(nullptr);
}

TEST_F(TenantProtocolTest, SingleTenantModeAllowsOneTenant)
{
    start({}, {{"MULTI_TENANT_ENABLED", "false"}});

    createAcme();
    TenantSpec second;
    second.tenant_id = "second";
    second.name = "Second";
    EXPECT_EQ(enforcer_->createTenant(platformAdmin(), second).code(), ResultCode::NotSupported);
}

TEST_F(TenantProtocolTest, CallsAfterShutdownAreUnavailable)
{
    createAcme();
    container_->shutdown();

    EXPECT_EQ(enforcer_->getTenantUsers(user("owner"), "acme").code(), ResultCode::UtilityUnavailable);
    EXPECT_FALSE(enforcer_->validateTenantAccess("owner", "acme"));
    EXPECT_EQ(enforcer_->counters().errored, 2u);
}

TEST_F(TenantProtocolTest, ConcurrentJoinsRespectTheLimit)
{
    createAcme(5);

    std::vector<std::thread> workers;
    for (int i = 0; i < 16; ++i) {
        workers.emplace_back([this, i] {
            enforcer_->addUserToTenant(user("owner"), "acme", "user" + std::to_string(i), "member");
        });
    }
    for (auto& worker : workers) worker.join();

    auto context = enforcer_->getTenantContext("acme");
    ASSERT_TRUE(context.value());
    EXPECT_EQ(context.value()->user_count, 5u);
}

TEST_F(TenantProtocolTest, ThrowingSinksLeaveResultsUnaffected)
{
    utilities::StandardOptions options;
    options.telemetry_sink = std::make_shared<ThrowingTelemetrySink>();
    options.health_sink = std::make_shared<ThrowingHealthSink>();
    start(options);

    auto created = enforcer_->createTenant(platformAdmin(), spec("acme"));
    ASSERT_TRUE(created) << to_string(created);
    EXPECT_TRUE(enforcer_->getTenantContext("acme").value());

    auto joined = enforcer_->addUserToTenant(user("owner"), "acme", "alice", "member");
    ASSERT_TRUE(joined) << to_string(joined);
    EXPECT_TRUE(enforcer_->validateTenantAccess("alice", "acme"));

    auto denied = enforcer_->getTenantUsers(user("mallory"), "acme");
    EXPECT_EQ(denied.code(), ResultCode::AccessDenied);

    ASSERT_TRUE(telemetry());
    EXPECT_GT(telemetry()->dropped(), 0u);
    EXPECT_EQ(telemetry()->emitted(), 0u);
    EXPECT_GE(telemetry()->counterValue("tenant_protocol.completed"), 2);
}

TEST_F(TenantProtocolTest, SingleTenantModeIgnoresDeletedTenants)
{
    start({}, {{"MULTI_TENANT_ENABLED", "false"}});

    createAcme();
    ASSERT_TRUE(enforcer_->deleteTenant(user("owner"), "acme"));

    auto replacement = enforcer_->createTenant(platformAdmin(), spec("second"));
    ASSERT_TRUE(replacement) << to_string(replacement);
    EXPECT_EQ(enforcer_->createTenant(platformAdmin(), spec("third")).code(), ResultCode::NotSupported);
}

TEST_F(TenantProtocolTest, ConcurrentCreatesInSingleTenantModeAdmitOne)
{
    start({}, {{"MULTI_TENANT_ENABLED", "false"}});

    std::atomic<int> created{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 12; ++i) {
        workers.emplace_back([this, i, &created, &refused] {
            auto res = enforcer_->createTenant(platformAdmin(), spec("tenant" + std::to_string(i)));
            if (res) {
                ++created;
            } else if (res.code() == ResultCode::NotSupported) {
                ++refused;
            }
        });
    }
    for (auto& worker : workers) worker.join();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(refused.load(), 11);

    auto tenants = enforcer_->listTenants(platformAdmin());
    ASSERT_TRUE(tenants);
    EXPECT_EQ(tenants->size(), 1u);
}

} // namespace
