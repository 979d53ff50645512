#include <gtest/gtest.h>
#include "core/plugin_gatekeeper.h"
#include "security/manifest_sealer.h"
#include <algorithm>
#include <mutex>

using namespace plugsec;
using namespace plugsec::security;

namespace {

class RecordingReporter : public ErrorReporter {
public:
    void report(const std::string& message, const std::string& category,
                const nlohmann::json& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
        categories_.push_back(category);
        contexts_.push_back(context);
    }

    size_t count(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(categories_.begin(), categories_.end(), category));
    }

    nlohmann::json lastContext(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = categories_.size(); i > 0; --i) {
            if (categories_[i - 1] == category) {
                return contexts_[i - 1];
            }
        }
        return nullptr;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    std::vector<std::string> categories_;
    std::vector<nlohmann::json> contexts_;
};

} // anonymous namespace

class PluginGatekeeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        reporter_ = std::make_shared<RecordingReporter>();
        host_ = std::make_shared<InMemoryHostServices>();
        gatekeeper_ = std::make_unique<PluginGatekeeper>(SecurityProperties(), host_, reporter_);

        manifest_.id = "amz-1";
        manifest_.name = "Amazon Orders";
        manifest_.version = "1.0.0";
        manifest_.fileTypes = {"csv"};
        manifest_.maxFileSize = 1000000;
        manifest_.endpoints["upload"] = "https://good.example/up";
        manifest_.capabilities.set(ManifestCapabilities::FILE_UPLOAD, true);
    }

    PluginManifest sealed(const PluginManifest& manifest) const {
        return ManifestSealer().seal(manifest, "verified.plugins");
    }

    std::shared_ptr<RecordingReporter> reporter_;
    std::shared_ptr<InMemoryHostServices> host_;
    std::unique_ptr<PluginGatekeeper> gatekeeper_;
    PluginManifest manifest_;
};

// ========== Registration ==========

TEST_F(PluginGatekeeperTest, SealedManifestRegisters) {
    ASSERT_NO_THROW(gatekeeper_->registerPlugin(sealed(manifest_)));

    EXPECT_TRUE(gatekeeper_->isRegistered("amz-1"));
    EXPECT_EQ(std::vector<std::string>{"amz-1"}, gatekeeper_->getPluginIds());
    EXPECT_EQ("Amazon Orders", gatekeeper_->getPlugin("amz-1")->name);

    PluginPermissions permissions = gatekeeper_->getPermissionManager().getPermissions("amz-1");
    EXPECT_TRUE(permissions.fileUpload);
    EXPECT_TRUE(permissions.networkAccess);
    EXPECT_TRUE(permissions.notifications);
    EXPECT_FALSE(permissions.clipboard);
}

TEST_F(PluginGatekeeperTest, DangerousFileTypeRejected) {
    manifest_.fileTypes = {"csv", "exe"};

    try {
        gatekeeper_->registerPlugin(sealed(manifest_));
        FAIL() << "Expected SecurityError";
    } catch (const SecurityError& e) {
        EXPECT_EQ("Plugin amz-1 failed security validation: Plugin supports dangerous file types: exe",
                  std::string(e.what()));
    }

    EXPECT_FALSE(gatekeeper_->isRegistered("amz-1"));
    EXPECT_FALSE(gatekeeper_->getPermissionManager().hasRecord("amz-1"));
    EXPECT_EQ(1u, reporter_->count(report_category::SECURITY_VALIDATION_FAILED));
    EXPECT_EQ("critical", reporter_->lastContext(report_category::SECURITY_VALIDATION_FAILED)["securityLevel"]);

    nlohmann::json registration = reporter_->lastContext(report_category::REGISTRATION);
    EXPECT_EQ("amz-1", registration["pluginId"]);
    EXPECT_EQ("Amazon Orders", registration["pluginName"]);
}

TEST_F(PluginGatekeeperTest, UnsealedManifestFailsIntegrity) {
    try {
        gatekeeper_->registerPlugin(manifest_);
        FAIL() << "Expected SecurityError";
    } catch (const SecurityError& e) {
        EXPECT_EQ("Plugin amz-1 failed integrity verification (trust score: 25%)", std::string(e.what()));
    }

    EXPECT_FALSE(gatekeeper_->isRegistered("amz-1"));
    EXPECT_EQ(1u, reporter_->count(report_category::INTEGRITY_VALIDATION_FAILED));

    nlohmann::json context = reporter_->lastContext(report_category::INTEGRITY_VALIDATION_FAILED);
    EXPECT_EQ("critical", context["riskLevel"]);
    EXPECT_EQ(3u, context["failedChecks"].size());
    EXPECT_EQ(1u, reporter_->count(report_category::REGISTRATION));
}

TEST_F(PluginGatekeeperTest, TamperedManifestRegistersAtThreshold) {
    PluginManifest tampered = sealed(manifest_);
    tampered.endpoints["upload"] = "https://other.example/up";

    EXPECT_NO_THROW(gatekeeper_->registerPlugin(tampered));

    PluginIntegrityInfo info = gatekeeper_->getIntegrityInfo("amz-1");
    EXPECT_DOUBLE_EQ(75.0, info.integrity.trustScore);
    EXPECT_EQ(RiskLevel::MEDIUM, info.integrity.riskLevel);
}

TEST_F(PluginGatekeeperTest, StricterThresholdRejectsTampering) {
    SecurityProperties props;
    props.set(SecurityProperties::PROP_ACCEPTANCE_THRESHOLD, 90.0);
    PluginGatekeeper strict(props, host_, reporter_);

    PluginManifest tampered = sealed(manifest_);
    tampered.endpoints["upload"] = "https://other.example/up";
    EXPECT_THROW(strict.registerPlugin(tampered), SecurityError);
}

TEST_F(PluginGatekeeperTest, ReRegistrationReplacesManifest) {
    gatekeeper_->registerPlugin(sealed(manifest_));
    manifest_.version = "1.1.0";
    gatekeeper_->registerPlugin(sealed(manifest_));

    EXPECT_EQ("1.1.0", gatekeeper_->getPlugin("amz-1")->version);
    EXPECT_EQ(1u, gatekeeper_->getPluginIds().size());
}

TEST_F(PluginGatekeeperTest, ReRegistrationDropsPreviouslyDerivedGrants) {
    gatekeeper_->registerPlugin(sealed(manifest_));
    gatekeeper_->getPermissionManager().grant("amz-1", {{Capability::CLIPBOARD, true}});
    ASSERT_TRUE(gatekeeper_->getPermissionManager().has("amz-1", Capability::NETWORK_ACCESS));

    manifest_.version = "2.0.0";
    manifest_.capabilities = ManifestCapabilities();
    gatekeeper_->registerPlugin(sealed(manifest_));

    PluginPermissions permissions = gatekeeper_->getPermissionManager().getPermissions("amz-1");
    EXPECT_EQ(PluginPermissions(), permissions);
    EXPECT_TRUE(permissions.fileUpload);
    EXPECT_FALSE(permissions.networkAccess);
    EXPECT_FALSE(permissions.notifications);
    EXPECT_FALSE(permissions.clipboard);
}

TEST_F(PluginGatekeeperTest, UnregisterRevokesPermissions) {
    gatekeeper_->registerPlugin(sealed(manifest_));
    ASSERT_TRUE(gatekeeper_->getPermissionManager().has("amz-1", Capability::NETWORK_ACCESS));

    EXPECT_TRUE(gatekeeper_->unregisterPlugin("amz-1"));
    EXPECT_FALSE(gatekeeper_->isRegistered("amz-1"));
    EXPECT_FALSE(gatekeeper_->getPermissionManager().has("amz-1", Capability::NETWORK_ACCESS));
    EXPECT_FALSE(gatekeeper_->unregisterPlugin("amz-1"));
}

// ========== Execution ==========

TEST_F(PluginGatekeeperTest, ExecuteRequiresRegistration) {
    try {
        gatekeeper_->executePluginOperation("ghost", [](sandbox::CancellationToken&) { return 1; });
        FAIL() << "Expected SecurityError";
    } catch (const SecurityError& e) {
        EXPECT_EQ("Plugin not found: ghost", std::string(e.what()));
    }
    EXPECT_EQ(0u, gatekeeper_->getSandbox().getExecutionStats("ghost").total);
}

TEST_F(PluginGatekeeperTest, RegisteredPluginUsesConstrainedContext) {
    host_->setFetchHandler([](const HttpRequest&, std::chrono::milliseconds) {
        HttpResponse response;
        response.status = 201;
        return response;
    });
    gatekeeper_->registerPlugin(sealed(manifest_));

    ConstrainedContext context = gatekeeper_->getPermissionManager().buildConstrainedContext("amz-1");
    int status = gatekeeper_->executePluginOperation("amz-1", [&context](sandbox::CancellationToken&) {
        HttpRequest request;
        request.method = "POST";
        request.url = "https://good.example/up";
        context.uploadFile("orders.csv", "id,total");
        return context.fetch(request).status;
    });

    EXPECT_EQ(201, status);
    EXPECT_EQ(1u, host_->getUploads().size());
    EXPECT_EQ(1u, gatekeeper_->getSandbox().getExecutionStats("amz-1").succeeded);
    EXPECT_THROW(context.readClipboard(), CapabilityDeniedError);
}

// ========== Inspection ==========

TEST_F(PluginGatekeeperTest, IntegrityInfo) {
    gatekeeper_->registerPlugin(sealed(manifest_));

    PluginIntegrityInfo info = gatekeeper_->getIntegrityInfo("amz-1");
    EXPECT_EQ("SECURE", info.overallStatus);
    EXPECT_DOUBLE_EQ(100.0, info.integrity.trustScore);
    EXPECT_EQ(RiskLevel::LOW, info.integrity.riskLevel);
    EXPECT_EQ(SecurityLevel::SECURE, info.validation.securityLevel);

    nlohmann::json json = info.toJson();
    EXPECT_EQ("secure", json["security"]["level"]);
    EXPECT_EQ(100.0, json["integrity"]["trustScore"]);
    EXPECT_EQ("low", json["integrity"]["riskLevel"]);
    EXPECT_EQ(4u, json["integrity"]["checks"].size());
    EXPECT_EQ(true, json["permissions"]["networkAccess"]);
    EXPECT_EQ("SECURE", json["overallStatus"]);

    EXPECT_THROW(gatekeeper_->getIntegrityInfo("ghost"), SecurityError);
}

TEST_F(PluginGatekeeperTest, SecurityInfo) {
    manifest_.capabilities.set(ManifestCapabilities::IMAGE_PROCESSING, true);
    manifest_.capabilities.set(ManifestCapabilities::BATCH_PROCESSING, true);
    gatekeeper_->registerPlugin(sealed(manifest_));

    PluginSecurityInfo info = gatekeeper_->getSecurityInfo("amz-1");
    EXPECT_EQ(SecurityLevel::LOW, info.securityLevel);
    EXPECT_TRUE(info.hasIssues);
    EXPECT_EQ(1u, info.warnings.size());
    EXPECT_EQ("low", info.toJson()["securityLevel"]);
}
