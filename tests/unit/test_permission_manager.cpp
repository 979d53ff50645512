#include <gtest/gtest.h>
#include "security/permission_manager.h"
#include "security/security_errors.h"
#include <thread>
#include <vector>

using namespace plugsec;
using namespace plugsec::security;

class PermissionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        host_ = std::make_shared<InMemoryHostServices>();
        host_->setFetchHandler([](const HttpRequest&, std::chrono::milliseconds) {
            HttpResponse response;
            response.status = 200;
            response.body = "ok";
            return response;
        });
        manager_ = std::make_unique<PermissionManager>(SecurityProperties(), host_);
    }

    std::shared_ptr<InMemoryHostServices> host_;
    std::unique_ptr<PermissionManager> manager_;
};

// ========== Permission types ==========

TEST(PermissionTypesTest, DefaultRecordIsFileUploadOnly) {
    PluginPermissions permissions;
    for (Capability capability : allCapabilities()) {
        EXPECT_EQ(capability == Capability::FILE_UPLOAD, permissions.get(capability))
            << capabilityToString(capability);
    }
    EXPECT_EQ(10u, allCapabilities().size());
}

TEST(PermissionTypesTest, NameConversions) {
    EXPECT_EQ("networkAccess", capabilityToString(Capability::NETWORK_ACCESS));
    EXPECT_EQ(Capability::DEVICE_INFO, stringToCapability("deviceInfo"));
    EXPECT_THROW(stringToCapability("teleport"), std::invalid_argument);

    EXPECT_EQ("showNotification", operationKindToString(OperationKind::SHOW_NOTIFICATION));
    EXPECT_EQ(OperationKind::CLIPBOARD_ACCESS, stringToOperationKind("clipboardAccess"));
    EXPECT_THROW(stringToOperationKind("formatDisk"), std::invalid_argument);
}

TEST(PermissionTypesTest, RequiredCapabilities) {
    EXPECT_EQ(std::vector<Capability>{Capability::NETWORK_ACCESS},
              requiredCapabilities(OperationKind::NETWORK_REQUEST));
    EXPECT_EQ(std::vector<Capability>{Capability::LOCAL_STORAGE},
              requiredCapabilities(OperationKind::LOCAL_STORAGE));
}

// ========== Store ==========

TEST_F(PermissionManagerTest, UnknownPluginHasDefaultRecord) {
    EXPECT_EQ(PluginPermissions(), manager_->getPermissions("nobody"));
    EXPECT_TRUE(manager_->has("nobody", Capability::FILE_UPLOAD));
    EXPECT_FALSE(manager_->has("nobody", Capability::CAMERA));
    EXPECT_FALSE(manager_->hasRecord("nobody"));
}

TEST_F(PermissionManagerTest, EmptyGrantMaterializesDefault) {
    manager_->grant("amz-1", {});
    EXPECT_TRUE(manager_->hasRecord("amz-1"));
    EXPECT_EQ(PluginPermissions(), manager_->getPermissions("amz-1"));
}

TEST_F(PermissionManagerTest, GrantsMerge) {
    manager_->grant("amz-1", {{Capability::NETWORK_ACCESS, true}});
    manager_->grant("amz-1", {{Capability::CLIPBOARD, true}, {Capability::FILE_UPLOAD, false}});

    PluginPermissions permissions = manager_->getPermissions("amz-1");
    EXPECT_FALSE(permissions.fileUpload);
    EXPECT_TRUE(permissions.networkAccess);
    EXPECT_TRUE(permissions.clipboard);
    EXPECT_FALSE(permissions.cookies);
}

TEST_F(PermissionManagerTest, RevokeAllRestoresDefault) {
    manager_->grant("amz-1", {{Capability::NETWORK_ACCESS, true}, {Capability::LOCATION, true}});
    manager_->revokeAll("amz-1");

    EXPECT_EQ(PluginPermissions(), manager_->getPermissions("amz-1"));
    EXPECT_FALSE(manager_->hasRecord("amz-1"));
}

TEST_F(PermissionManagerTest, PluginsAreIndependent) {
    manager_->grant("a-plugin", {{Capability::COOKIES, true}});
    EXPECT_FALSE(manager_->has("b-plugin", Capability::COOKIES));
    EXPECT_EQ(std::vector<std::string>{"a-plugin"}, manager_->getPluginIds());
}

TEST_F(PermissionManagerTest, InstancesAreIsolated) {
    PermissionManager other;
    manager_->grant("amz-1", {{Capability::CAMERA, true}});
    EXPECT_FALSE(other.has("amz-1", Capability::CAMERA));
}

// ========== Operation checks ==========

TEST_F(PermissionManagerTest, CheckOperationListsMissingCapabilities) {
    PermissionCheckResult result = manager_->checkOperation("amz-1", OperationKind::NETWORK_REQUEST);
    EXPECT_FALSE(result.allowed);
    EXPECT_EQ(std::vector<std::string>{"networkAccess"}, result.missingCapabilities);
    EXPECT_EQ("networkRequest", result.operation);
    EXPECT_EQ("amz-1", result.pluginId);

    EXPECT_TRUE(manager_->checkOperation("amz-1", OperationKind::FILE_UPLOAD).allowed);

    manager_->grant("amz-1", {{Capability::NETWORK_ACCESS, true}});
    result = manager_->checkOperation("amz-1", "networkRequest");
    EXPECT_TRUE(result.allowed);
    EXPECT_TRUE(result.missingCapabilities.empty());
    EXPECT_FALSE(result.unknownOperation);
}

TEST_F(PermissionManagerTest, UnknownOperationDeniedByDefault) {
    PermissionCheckResult result = manager_->checkOperation("amz-1", "formatDisk");
    EXPECT_FALSE(result.allowed);
    EXPECT_TRUE(result.unknownOperation);
    EXPECT_TRUE(result.missingCapabilities.empty());
    EXPECT_EQ("formatDisk", result.operation);
}

TEST_F(PermissionManagerTest, UnknownOperationAllowedWhenConfigured) {
    SecurityProperties props;
    props.setAllowUnknownOperations(true);
    PermissionManager permissive(props);

    PermissionCheckResult result = permissive.checkOperation("amz-1", "formatDisk");
    EXPECT_TRUE(result.allowed);
    EXPECT_TRUE(result.unknownOperation);
}

TEST_F(PermissionManagerTest, CheckResultJson) {
    nlohmann::json json = manager_->checkOperation("amz-1", OperationKind::DEVICE_INFO).toJson();
    EXPECT_EQ(false, json["allowed"]);
    EXPECT_EQ("deviceInfo", json["missingCapabilities"][0]);
}

// ========== Auto grant ==========

TEST_F(PermissionManagerTest, AutoGrantFromFileUpload) {
    ManifestCapabilities declared;
    declared.set(ManifestCapabilities::FILE_UPLOAD, true);
    manager_->autoGrant("amz-1", declared);

    PluginPermissions permissions = manager_->getPermissions("amz-1");
    EXPECT_TRUE(permissions.fileUpload);
    EXPECT_TRUE(permissions.networkAccess);
    EXPECT_TRUE(permissions.notifications);
    EXPECT_FALSE(permissions.localStorage);
    EXPECT_FALSE(permissions.clipboard);
}

TEST_F(PermissionManagerTest, AutoGrantFromManualEntry) {
    ManifestCapabilities declared;
    declared.set(ManifestCapabilities::MANUAL_ENTRY, true);
    manager_->autoGrant("manual-1", declared);

    PluginPermissions permissions = manager_->getPermissions("manual-1");
    EXPECT_TRUE(permissions.fileUpload);
    EXPECT_TRUE(permissions.networkAccess);
    EXPECT_FALSE(permissions.notifications);
}

TEST_F(PermissionManagerTest, AutoGrantFromBatchProcessing) {
    ManifestCapabilities declared;
    declared.set(ManifestCapabilities::BATCH_PROCESSING, true);
    manager_->autoGrant("batch-1", declared);

    PluginPermissions permissions = manager_->getPermissions("batch-1");
    EXPECT_FALSE(permissions.networkAccess);
    EXPECT_TRUE(permissions.notifications);
}

TEST_F(PermissionManagerTest, AutoGrantNothingDeclared) {
    manager_->autoGrant("bare-1", ManifestCapabilities());
    EXPECT_EQ(PluginPermissions(), manager_->getPermissions("bare-1"));
}

// ========== Constrained context ==========

TEST_F(PermissionManagerTest, NetworkDeniedThenGranted) {
    ConstrainedContext denied = manager_->buildConstrainedContext("amz-1");

    HttpRequest request;
    request.url = "https://good.example/up";
    try {
        denied.fetch(request);
        FAIL() << "Expected CapabilityDeniedError";
    } catch (const CapabilityDeniedError& e) {
        EXPECT_EQ("networkAccess", e.getCapability());
        EXPECT_EQ("amz-1", e.getPluginId());
        EXPECT_EQ("Plugin 'amz-1' does not have permission: networkAccess", std::string(e.what()));
    }
    EXPECT_TRUE(host_->getFetchLog().empty());

    manager_->grant("amz-1", {{Capability::NETWORK_ACCESS, true}});
    ConstrainedContext granted = manager_->buildConstrainedContext("amz-1");
    HttpResponse response = granted.fetch(request);
    EXPECT_EQ(200, response.status);
    EXPECT_EQ(1u, host_->getFetchLog().size());
}

TEST_F(PermissionManagerTest, ContextSnapshotsPermissions) {
    ConstrainedContext context = manager_->buildConstrainedContext("amz-1");
    manager_->grant("amz-1", {{Capability::CLIPBOARD, true}});

    EXPECT_THROW(context.readClipboard(), CapabilityDeniedError);
    EXPECT_NO_THROW(manager_->buildConstrainedContext("amz-1").readClipboard());
}

TEST_F(PermissionManagerTest, ConcurrentGrants) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                manager_->grant("plugin-" + std::to_string(t), {{Capability::NETWORK_ACCESS, i % 2 == 0}});
                manager_->has("plugin-" + std::to_string(t), Capability::NETWORK_ACCESS);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(8u, manager_->getPluginIds().size());
}
