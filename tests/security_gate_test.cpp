#include "agency/security/security_gate.hpp"

#include <filesystem>
#include <string>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace agency;

class SecurityGateTest : public ::testing::Test {
protected:
  auto make_gate(SecurityPolicy policy = {}) -> SecurityGate {
    if (policy.allowed_base_paths.empty()) {
      policy.allowed_base_paths = {dir_.str()};
    }
    return SecurityGate{std::move(policy)};
  }

  auto inside(std::string_view relative) const -> std::string {
    return (dir_.path() / relative).string();
  }

  test::TempDir dir_{"agency_gate"};
};

TEST_F(SecurityGateTest, AcceptsFileInsideAllowedBase) {
  auto gate = make_gate();
  dir_.write("notes.md", "# notes");

  auto v = gate.validate_path(inside("notes.md"));
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.violations.empty());
  EXPECT_FALSE(v.rejection.has_value());
  EXPECT_EQ(v.resolved_path.filename(), "notes.md");
}

TEST_F(SecurityGateTest, AcceptsNotYetExistingOutputPath) {
  auto gate = make_gate();
  auto v = gate.validate_path(inside("out/report.md"), FileOperation::Write);
  EXPECT_TRUE(v.valid);
}

TEST_F(SecurityGateTest, RejectsTraversalBeforeResolving) {
  auto gate = make_gate();

  auto v = gate.validate_path("../../etc/passwd");
  EXPECT_FALSE(v.valid);
  ASSERT_TRUE(v.rejection.has_value());
  EXPECT_EQ(*v.rejection, SecurityEventKind::PathTraversalAttempt);
  ASSERT_EQ(v.violations.size(), 1);
  EXPECT_EQ(v.violations[0], "path traversal attempt detected");
}

TEST_F(SecurityGateTest, RejectsEncodedTraversal) {
  auto gate = make_gate();
  for (std::string_view p : {"%2e%2e/secret.md", "%2E%2E%2Fsecret.md",
                             "docs/.%2e/x.md", "docs%c0%ae%c0%ae/x.md"}) {
    auto v = gate.validate_path(p);
    EXPECT_FALSE(v.valid) << p;
    EXPECT_EQ(v.rejection, SecurityEventKind::PathTraversalAttempt) << p;
  }
}

TEST_F(SecurityGateTest, DotDotOnlyRejectedAsWholeSegment) {
  auto gate = make_gate();
  for (std::string_view name : {"notes..md", "v1..2.txt", "draft...md"}) {
    auto v = gate.validate_path(inside(name), FileOperation::Write);
    EXPECT_TRUE(v.valid) << name;
  }
  for (std::string_view p : {"..", "../x.md", "docs/../x.md", "docs/..",
                             "docs\\..\\x.md"}) {
    auto v = gate.validate_path(p);
    EXPECT_FALSE(v.valid) << p;
    EXPECT_EQ(v.rejection, SecurityEventKind::PathTraversalAttempt) << p;
  }
  EXPECT_TRUE(gate.validate_glob_pattern("docs/*..md"));
}

TEST_F(SecurityGateTest, RejectsControlCharacters) {
  auto gate = make_gate();
  std::string path = inside("a.md");
  path.push_back('\0');
  path += ".txt";

  auto v = gate.validate_path(path);
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::InvalidPath);

  EXPECT_FALSE(gate.validate_path(inside("a\nb.md")).valid);
  EXPECT_FALSE(gate.validate_path("").valid);
}

TEST_F(SecurityGateTest, RejectsPathOutsideAllowedBases) {
  auto gate = make_gate();
  auto v = gate.validate_path("/opt/agency-elsewhere/notes.md");
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::UnauthorizedPathAccess);
}

TEST_F(SecurityGateTest, BasePrefixIsComparedBySegment) {
  auto gate = make_gate();
  auto sibling = dir_.str() + "-sibling/notes.md";
  EXPECT_FALSE(gate.validate_path(sibling).valid);
}

TEST_F(SecurityGateTest, RejectsDefaultRestrictedSystemPath) {
  SecurityPolicy policy;
  policy.allowed_base_paths = {"/"};
  SecurityGate gate{policy};

  auto v = gate.validate_path("/etc/passwd");
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::AccessDenied);

  auto ssh = gate.validate_path("/root/.ssh/id_rsa");
  EXPECT_FALSE(ssh.valid);
  EXPECT_EQ(ssh.rejection, SecurityEventKind::AccessDenied);
}

TEST_F(SecurityGateTest, RejectsRestrictedPrefixAndGlob) {
  SecurityPolicy policy;
  policy.restricted_paths = {inside("secrets"), inside("*/private")};
  auto gate = make_gate(policy);
  dir_.write("secrets/key.md", "k");
  dir_.write("team/private/plan.md", "p");
  dir_.write("team/public/plan.md", "p");

  EXPECT_EQ(gate.validate_path(inside("secrets/key.md")).rejection,
            SecurityEventKind::AccessDenied);
  EXPECT_EQ(gate.validate_path(inside("team/private/plan.md")).rejection,
            SecurityEventKind::AccessDenied);
  EXPECT_TRUE(gate.validate_path(inside("team/public/plan.md")).valid);
}

TEST_F(SecurityGateTest, RejectsExistingFileWithDisallowedExtension) {
  auto gate = make_gate();
  dir_.write("run.sh", "echo hi");

  auto v = gate.validate_path(inside("run.sh"));
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::ExtensionViolation);

  dir_.write("README.MD", "upper-case extension");
  EXPECT_TRUE(gate.validate_path(inside("README.MD")).valid);
}

TEST_F(SecurityGateTest, RejectsOversizedFile) {
  SecurityPolicy policy;
  policy.max_file_size = 16;
  auto gate = make_gate(policy);
  dir_.write("big.txt", std::string(64, 'a'));

  auto v = gate.validate_path(inside("big.txt"));
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::FileSizeViolation);
}

TEST_F(SecurityGateTest, RejectsExcessiveDepth) {
  SecurityPolicy policy;
  policy.max_depth = 2;
  policy.allowed_base_paths = {"/"};
  policy.restricted_paths.clear();
  SecurityGate gate{policy};

  auto v = gate.validate_path("/a/b/c/d.md", FileOperation::Write);
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::DepthViolation);
}

TEST_F(SecurityGateTest, RejectsSymlinkUnlessAllowed) {
  dir_.write("target.md", "t");
  std::filesystem::create_symlink(dir_.path() / "target.md",
                                  dir_.path() / "link.md");

  auto strict = make_gate();
  auto v = strict.validate_path(inside("link.md"));
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.rejection, SecurityEventKind::SymlinkRejected);

  SecurityPolicy policy;
  policy.allow_symlinks = true;
  auto relaxed = make_gate(policy);
  EXPECT_TRUE(relaxed.validate_path(inside("link.md")).valid);
}

TEST_F(SecurityGateTest, SanitizeStripsControlCharacters) {
  auto gate = make_gate();
  std::string text = "a\x01" "b\tc\r\n\x7f" "d";
  EXPECT_EQ(gate.sanitize_content(text), "ab\tc\r\nd");
}

TEST_F(SecurityGateTest, SanitizeNeutralizesScripts) {
  auto gate = make_gate();
  std::string placeholder{SecurityGate::kSanitizedPlaceholder};

  EXPECT_EQ(gate.sanitize_content("<script>alert(1)</script>hello"),
            placeholder + "hello");
  EXPECT_EQ(gate.sanitize_content("go javascript:run()"),
            "go " + placeholder + "run()");
  EXPECT_EQ(gate.sanitize_content("<img onerror=x>"),
            "<img " + placeholder + "x>");
  EXPECT_EQ(gate.sanitize_content("plain markdown text"), "plain markdown text");

  auto events = gate.audit_log(Severity::High);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().kind, SecurityEventKind::InjectionAttempt);
}

TEST_F(SecurityGateTest, SanitizeHandlesUnclosedAndStrayScriptTags) {
  auto gate = make_gate();
  std::string placeholder{SecurityGate::kSanitizedPlaceholder};

  EXPECT_EQ(gate.sanitize_content("a <SCRIPT type=\"x\">b"),
            "a " + placeholder + "b");
  EXPECT_EQ(gate.sanitize_content("a </script >b"), "a " + placeholder + "b");
  EXPECT_EQ(gate.sanitize_content("<scripts>ok</scripts>"),
            "<scripts>ok</scripts>");
  EXPECT_EQ(gate.sanitize_content("<script>a</script>-<script>b</Script>"),
            placeholder + "-" + placeholder);
}

TEST_F(SecurityGateTest, SanitizeLargeScriptBody) {
  auto gate = make_gate();
  std::string placeholder{SecurityGate::kSanitizedPlaceholder};

  std::string body(1 << 20, 'x');
  for (std::size_t i = 0; i < body.size(); i += 64) {
    body[i] = '\n';
  }
  auto text = "pre<script>" + body + "</script>post";
  EXPECT_EQ(gate.sanitize_content(text), "pre" + placeholder + "post");

  auto unclosed = "pre<script>" + body;
  auto cleaned = gate.sanitize_content(unclosed);
  EXPECT_EQ(cleaned.substr(0, 3 + placeholder.size()), "pre" + placeholder);
  EXPECT_EQ(cleaned.size(), 3 + placeholder.size() + body.size());
}

TEST_F(SecurityGateTest, WriteThenReadThroughGate) {
  auto gate = make_gate();
  auto path = inside("out/nested/result.md");

  ASSERT_TRUE(gate.write_file(path, "result <script>x</script>").has_value());
  auto read = gate.read_file(path);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, std::format("result {}", SecurityGate::kSanitizedPlaceholder));
}

TEST_F(SecurityGateTest, ReadRejectedAndMissingFiles) {
  auto gate = make_gate();

  auto rejected = gate.read_file("../../etc/passwd");
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error(), make_error_code(Error::SecurityViolation));

  auto missing = gate.read_file(inside("missing.md"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}

TEST_F(SecurityGateTest, GlobPatterns) {
  auto gate = make_gate();
  EXPECT_TRUE(gate.validate_glob_pattern("src/**/*.ts"));
  EXPECT_FALSE(gate.validate_glob_pattern("/etc/*"));
  EXPECT_FALSE(gate.validate_glob_pattern("~/notes/*.md"));
  EXPECT_FALSE(gate.validate_glob_pattern("../*.md"));
  EXPECT_FALSE(gate.validate_glob_pattern(""));
}

TEST_F(SecurityGateTest, AuditLogAndReport) {
  auto gate = make_gate();
  dir_.write("ok.md", "fine");

  (void)gate.validate_path(inside("ok.md"));
  (void)gate.validate_path("../../etc/passwd");
  (void)gate.validate_path("/opt/agency-elsewhere/x.md");

  auto all = gate.audit_log();
  ASSERT_EQ(all.size(), 3);
  // Newest first.
  EXPECT_EQ(all[0].kind, SecurityEventKind::UnauthorizedPathAccess);
  EXPECT_EQ(all[2].kind, SecurityEventKind::AccessGranted);

  EXPECT_EQ(gate.audit_log(Severity::High).size(), 2);
  EXPECT_EQ(gate.audit_log(Severity::Low, 1).size(), 1);

  auto report = gate.report();
  EXPECT_EQ(report.total_events, 3);
  EXPECT_EQ(report.events_by_severity[std::to_underlying(Severity::High)], 2);
  EXPECT_NE(report.to_markdown().find("path_traversal_attempt: 1"),
            std::string::npos);

  gate.clear_audit_log();
  EXPECT_TRUE(gate.audit_log().empty());
}

TEST_F(SecurityGateTest, AuditLogIsBounded) {
  SecurityPolicy policy;
  policy.max_audit_events = 10;
  auto gate = make_gate(policy);

  for (int i = 0; i < 25; ++i) {
    (void)gate.validate_path("../escape.md");
  }
  EXPECT_LE(gate.audit_log().size(), 10);
}
