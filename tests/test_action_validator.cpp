#include <gtest/gtest.h>
#include <ai-mailguard/core/action_validator.hpp>

using namespace mailguard;

static ExtractedParams params(std::initializer_list<std::pair<ParamKey, const char*>> kv) {
    ExtractedParams p;
    for (auto& e : kv) p.set(e.first, e.second);
    return p;
}

TEST(ClassifyAction, VerbLists) {
    EXPECT_EQ(classify_action("read_email"), IntentKind::Read);
    EXPECT_EQ(classify_action("RETRIEVE_INBOX"), IntentKind::Read);
    EXPECT_EQ(classify_action("send_reply"), IntentKind::Write);
    EXPECT_EQ(classify_action("forward_message"), IntentKind::Write);
    EXPECT_EQ(classify_action("trash_message"), IntentKind::Delete);
    EXPECT_EQ(classify_action("archive_message"), IntentKind::Unknown);
    // read verbs are checked first
    EXPECT_EQ(classify_action("get_and_delete"), IntentKind::Read);
}

TEST(ActionValidator, ValidBaseline) {
    IntentExtractor ex; ActionValidator v(ex);
    auto r = v.validate("Read the latest email from john@example.com", "read_email",
                        params({{ParamKey::From, "john@example.com"}}));
    EXPECT_TRUE(r.approved);
    EXPECT_EQ(r.reason, "Parameters validated successfully");
}

TEST(ActionValidator, HijackedWriteRejected) {
    IntentExtractor ex; ActionValidator v(ex);
    auto r = v.validate("Read the latest email from john@example.com", "write_email",
                        params({{ParamKey::To, "attacker@evil.com"}}));
    EXPECT_FALSE(r.approved);
    EXPECT_EQ(r.reason, "Intent mismatch: User intended read but action is write");
}

TEST(ActionValidator, FromMismatchRejected) {
    IntentExtractor ex; ActionValidator v(ex);
    auto r = v.validate("Read emails from john@example.com with subject 'Project Update'", "read_email",
                        params({{ParamKey::From, "attacker@evil.com"}, {ParamKey::Subject, "Project Update"}}));
    EXPECT_FALSE(r.approved);
    EXPECT_NE(r.reason.find("From address mismatch"), std::string::npos);
    EXPECT_NE(r.reason.find("john@example.com"), std::string::npos);
    EXPECT_NE(r.reason.find("attacker@evil.com"), std::string::npos);
}

TEST(ActionValidator, SubjectComparedCaseInsensitively) {
    IntentExtractor ex; ActionValidator v(ex);
    auto ok = v.validate("Read emails with subject 'Project Update'", "read_email",
                         params({{ParamKey::Subject, "PROJECT update"}}));
    EXPECT_TRUE(ok.approved);
    auto bad = v.validate("Delete the email with subject 'Project Update'", "delete_email",
                          params({{ParamKey::Subject, "Invoice"}}));
    EXPECT_FALSE(bad.approved);
    EXPECT_EQ(bad.reason, "Subject mismatch: User specified 'Project Update' but action uses 'Invoice'");
}

TEST(ActionValidator, FromComparedExactly) {
    IntentExtractor ex; ActionValidator v(ex);
    auto r = v.validate("Read the latest email from john@example.com", "read_email",
                        params({{ParamKey::From, "John@Example.com"}}));
    EXPECT_FALSE(r.approved);
}

TEST(ActionValidator, WriteComparesTo) {
    IntentExtractor ex; ActionValidator v(ex);
    auto bad = v.validate("Send an email to bob@example.com", "send_email",
                          params({{ParamKey::To, "eve@evil.com"}}));
    EXPECT_FALSE(bad.approved);
    EXPECT_EQ(bad.reason, "To address mismatch: User specified bob@example.com but action uses eve@evil.com");
    // from is not a write constraint
    auto ok = v.validate("Send an email to bob@example.com", "send_email",
                         params({{ParamKey::To, "bob@example.com"}, {ParamKey::From, "me@example.com"}}));
    EXPECT_TRUE(ok.approved);
}

TEST(ActionValidator, UnknownIntentAlwaysRejected) {
    IntentExtractor ex; ActionValidator v(ex);
    auto both = v.validate("Hello there", "archive_message", {});
    EXPECT_FALSE(both.approved);
    EXPECT_EQ(both.reason, "Unknown user intent");
    auto mismatch = v.validate("Hello there", "read_email", {});
    EXPECT_FALSE(mismatch.approved);
    EXPECT_EQ(mismatch.reason, "Intent mismatch: User intended unknown but action is read");
}

TEST(ActionValidator, AbsentFieldsAreUnconstrained) {
    IntentExtractor ex; ActionValidator v(ex);
    const std::string prompt = "Read the latest email from john@example.com";
    auto base = params({{ParamKey::From, "john@example.com"}});
    ASSERT_TRUE(v.validate(prompt, "read_email", base).approved);
    auto more = base; more.set(ParamKey::Subject, "Anything");
    EXPECT_TRUE(v.validate(prompt, "read_email", more).approved);
    more.set(ParamKey::To, "someone@example.com");
    EXPECT_TRUE(v.validate(prompt, "read_email", more).approved);
    // user constraint with nothing on the action side
    EXPECT_TRUE(v.validate(prompt, "read_email", {}).approved);
}
