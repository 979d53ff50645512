#include <gtest/gtest.h>
#include "security/digest.h"
#include "security/integrity_verifier.h"
#include "security/manifest_sealer.h"
#include <mutex>

using namespace plugsec;
using namespace plugsec::security;

namespace {

class RecordingReporter : public ErrorReporter {
public:
    struct Entry {
        std::string message;
        std::string category;
        nlohmann::json context;
    };

    void report(const std::string& message, const std::string& category,
                const nlohmann::json& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({message, category, context});
    }

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // anonymous namespace

class IntegrityVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        reporter_ = std::make_shared<RecordingReporter>();
        verifier_ = std::make_unique<IntegrityVerifier>(SecurityProperties(), reporter_);

        manifest_.id = "amz-1";
        manifest_.name = "Amazon Orders";
        manifest_.version = "1.0.0";
        manifest_.fileTypes = {"csv"};
        manifest_.maxFileSize = 1000000;
        manifest_.endpoints["upload"] = "https://good.example/up";
        manifest_.capabilities.set(ManifestCapabilities::FILE_UPLOAD, true);
    }

    PluginManifest sealed(const std::string& source = "verified.plugins") const {
        return ManifestSealer().seal(manifest_, source);
    }

    std::shared_ptr<RecordingReporter> reporter_;
    std::unique_ptr<IntegrityVerifier> verifier_;
    PluginManifest manifest_;
};

TEST_F(IntegrityVerifierTest, SealedManifestFromTrustedSourceScoresFull) {
    IntegrityCheckResult result = verifier_->verify(sealed());

    EXPECT_TRUE(result.isValid);
    EXPECT_DOUBLE_EQ(100.0, result.trustScore);
    EXPECT_EQ(RiskLevel::LOW, result.riskLevel);
    ASSERT_EQ(4u, result.checks.size());
    for (const auto& check : result.checks) {
        EXPECT_TRUE(check.passed) << check.name << ": " << check.message;
        EXPECT_EQ(Severity::INFO, check.severity);
    }
    EXPECT_EQ(std::vector<std::string>{"Plugin passed all integrity checks"}, result.recommendations);
}

TEST_F(IntegrityVerifierTest, ContentHashIsDeterministic) {
    EXPECT_EQ(IntegrityVerifier::computeContentHash(manifest_),
              IntegrityVerifier::computeContentHash(manifest_));
    EXPECT_EQ(64u, IntegrityVerifier::computeContentHash(manifest_).size());

    // Insertion order of endpoints does not matter
    PluginManifest reordered = manifest_;
    reordered.endpoints.clear();
    reordered.endpoints["status"] = "https://good.example/s";
    reordered.endpoints["upload"] = "https://good.example/up";
    PluginManifest other = manifest_;
    other.endpoints["status"] = "https://good.example/s";
    EXPECT_EQ(IntegrityVerifier::computeContentHash(reordered),
              IntegrityVerifier::computeContentHash(other));
}

TEST_F(IntegrityVerifierTest, HashCoversCanonicalContentOnly) {
    PluginManifest described = manifest_;
    described.description = "changed";
    described.fileTypes = {"pdf"};
    EXPECT_EQ(IntegrityVerifier::computeContentHash(manifest_),
              IntegrityVerifier::computeContentHash(described));

    PluginManifest renamed = manifest_;
    renamed.name = "Other";
    EXPECT_NE(IntegrityVerifier::computeContentHash(manifest_),
              IntegrityVerifier::computeContentHash(renamed));
}

TEST_F(IntegrityVerifierTest, HashMismatchIsCritical) {
    PluginManifest manifest = sealed();
    manifest.endpoints["upload"] = "https://evil.example/up";

    IntegrityCheckResult result = verifier_->verify(manifest);
    EXPECT_LT(result.trustScore, 100.0);

    const IntegrityCheck* check = result.findCheck(IntegrityVerifier::CHECK_CONTENT_HASH);
    ASSERT_NE(nullptr, check);
    EXPECT_FALSE(check->passed);
    EXPECT_EQ(Severity::CRITICAL, check->severity);
    EXPECT_EQ("Content hash mismatch - possible tampering", check->message);
    EXPECT_DOUBLE_EQ(75.0, result.trustScore);
    EXPECT_EQ(RiskLevel::MEDIUM, result.riskLevel);
}

TEST_F(IntegrityVerifierTest, MissingProvenance) {
    IntegrityCheckResult result = verifier_->verify(manifest_);

    EXPECT_FALSE(result.isValid);
    EXPECT_DOUBLE_EQ(25.0, result.trustScore);
    EXPECT_EQ(RiskLevel::CRITICAL, result.riskLevel);

    EXPECT_EQ("Plugin lacks digital signature",
              result.findCheck(IntegrityVerifier::CHECK_SIGNATURE)->message);
    EXPECT_EQ("No content hash provided",
              result.findCheck(IntegrityVerifier::CHECK_CONTENT_HASH)->message);
    EXPECT_EQ("Unknown plugin source",
              result.findCheck(IntegrityVerifier::CHECK_SOURCE)->message);
    EXPECT_TRUE(result.findCheck(IntegrityVerifier::CHECK_TAMPERING)->passed);
    EXPECT_EQ(3u, result.recommendations.size());
}

TEST_F(IntegrityVerifierTest, UntrustedSourceIsLowSeverity) {
    IntegrityCheckResult result = verifier_->verify(sealed("random.site"));

    const IntegrityCheck* check = result.findCheck(IntegrityVerifier::CHECK_SOURCE);
    ASSERT_NE(nullptr, check);
    EXPECT_FALSE(check->passed);
    EXPECT_EQ(Severity::LOW, check->severity);
    EXPECT_EQ("Untrusted source: random.site", check->message);
    EXPECT_TRUE(result.isValid);
    EXPECT_DOUBLE_EQ(75.0, result.trustScore);
}

TEST_F(IntegrityVerifierTest, SignatureFormatRules) {
    PluginManifest manifest = sealed();

    manifest.signature->version = "v2";
    EXPECT_EQ("Unsupported signature version",
              verifier_->verify(manifest).findCheck(IntegrityVerifier::CHECK_SIGNATURE)->message);

    manifest = sealed();
    manifest.signature->value = "sha256:abc";
    EXPECT_EQ("Invalid signature format",
              verifier_->verify(manifest).findCheck(IntegrityVerifier::CHECK_SIGNATURE)->message);

    manifest = sealed();
    manifest.signature->value = std::string(80, 'z');
    EXPECT_FALSE(verifier_->verify(manifest).findCheck(IntegrityVerifier::CHECK_SIGNATURE)->passed);

    manifest = sealed();
    manifest.signature->algorithm.clear();
    EXPECT_FALSE(verifier_->verify(manifest).findCheck(IntegrityVerifier::CHECK_SIGNATURE)->passed);
}

TEST_F(IntegrityVerifierTest, TamperingHeuristics) {
    PluginManifest manifest = manifest_;
    manifest.capabilities.set("rootAccess", true);
    manifest.rawJson = {{"plugin", {{"id", 7}}}};

    const IntegrityCheck* check =
        verifier_->verify(manifest).findCheck(IntegrityVerifier::CHECK_TAMPERING);
    ASSERT_NE(nullptr, check);
    EXPECT_FALSE(check->passed);
    EXPECT_EQ(Severity::HIGH, check->severity);
    EXPECT_NE(std::string::npos, check->message.find("Plugin ID has been modified"));
    EXPECT_NE(std::string::npos, check->message.find("unknown capabilities (rootAccess)"));
}

TEST_F(IntegrityVerifierTest, VeryLongVersionFlaggedAsTampering) {
    PluginManifest manifest = manifest_;
    manifest.version = std::string(300000, '9');

    const IntegrityCheck* check =
        verifier_->verify(manifest).findCheck(IntegrityVerifier::CHECK_TAMPERING);
    ASSERT_NE(nullptr, check);
    EXPECT_FALSE(check->passed);
    EXPECT_NE(std::string::npos, check->message.find("Invalid version format"));
}

TEST_F(IntegrityVerifierTest, LocalEndpointsFlaggedInProductionOnly) {
    manifest_.endpoints["status"] = "https://localhost/status";
    EXPECT_TRUE(verifier_->verify(manifest_).findCheck(IntegrityVerifier::CHECK_TAMPERING)->passed);

    SecurityProperties props;
    props.setProductionMode(true);
    IntegrityVerifier production(props, reporter_);
    const IntegrityCheck* check =
        production.verify(manifest_).findCheck(IntegrityVerifier::CHECK_TAMPERING);
    EXPECT_NE(std::string::npos, check->message.find("Suspicious local endpoints in production"));
}

TEST_F(IntegrityVerifierTest, HashFailureBecomesSystemCheck) {
    verifier_->setHashFunction([](const std::string&) -> std::string {
        throw std::runtime_error("digest unavailable");
    });

    IntegrityCheckResult result = verifier_->verify(sealed());

    EXPECT_FALSE(result.isValid);
    EXPECT_DOUBLE_EQ(0.0, result.trustScore);
    EXPECT_EQ(RiskLevel::CRITICAL, result.riskLevel);
    ASSERT_EQ(1u, result.checks.size());
    EXPECT_EQ(IntegrityVerifier::CHECK_SYSTEM, result.checks[0].name);
    EXPECT_EQ(Severity::CRITICAL, result.checks[0].severity);

    auto entries = reporter_->entries();
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ(report_category::INTEGRITY_VALIDATION_FAILED, entries[0].category);
    EXPECT_EQ("digest unavailable", entries[0].message);
}

TEST_F(IntegrityVerifierTest, TrustedSourceManagement) {
    EXPECT_FALSE(verifier_->isTrustedSource("corp.internal"));
    verifier_->addTrustedSource("corp.internal");
    verifier_->addTrustedSource("corp.internal");
    EXPECT_TRUE(verifier_->isTrustedSource("corp.internal"));
    EXPECT_EQ(4u, verifier_->getTrustedSources().size());

    EXPECT_DOUBLE_EQ(100.0, verifier_->verify(sealed("corp.internal")).trustScore);

    EXPECT_TRUE(verifier_->removeTrustedSource("corp.internal"));
    EXPECT_FALSE(verifier_->removeTrustedSource("corp.internal"));
}

TEST_F(IntegrityVerifierTest, ReportSummary) {
    IntegrityCheckResult result = verifier_->verify(sealed("random.site"));
    IntegrityReport report = IntegrityVerifier::generateReport(result, "amz-1");

    EXPECT_EQ("amz-1", report.pluginId);
    EXPECT_EQ("PASS", report.overallStatus);
    EXPECT_EQ("Plugin amz-1 scored 75.0% trust score with medium risk level", report.summary);
    ASSERT_EQ(4u, report.checks.size());
    EXPECT_EQ("FAIL", report.checks[2].status);
    EXPECT_EQ("low", report.checks[2].severity);
    EXPECT_EQ(24u, report.timestamp.size());

    nlohmann::json json = report.toJson();
    EXPECT_EQ("medium", json["riskLevel"]);
    EXPECT_EQ(4u, json["checks"].size());
}

TEST(DigestTest, KnownVector) {
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", sha256Hex("abc"));
}
