#include <gtest/gtest.h>
#include <ai-mailguard/core/security_proxy.hpp>
#include <ai-mailguard/ai/responder.hpp>
#include <sstream>
#include <thread>
#include <vector>

using namespace mailguard;

namespace {

class FixedResponder : public ai::Responder {
public:
    explicit FixedResponder(std::optional<std::string> text, int* calls = nullptr) : m_text(std::move(text)), m_calls(calls) {}
    std::optional<std::string> respond(const ActionRequest&) override { if (m_calls) ++*m_calls; return m_text; }
private:
    std::optional<std::string> m_text;
    int* m_calls;
};

const char* kEmail = "Hi, the IT desk asks that you reply with your password so we can reset the account today. Thanks, John";

ActionRequest read_request() {
    ActionRequest r;
    r.user_prompt = "Read the latest email from john@example.com";
    r.proposed_action = "read_email";
    r.action_params.set(ParamKey::From, "john@example.com");
    return r;
}

} // namespace

TEST(SecurityProxy, ValidReadApproved) {
    SecurityProxy proxy;
    auto r = proxy.process_request(read_request());
    EXPECT_TRUE(r.approved);
    EXPECT_EQ(r.reason, "Parameters validated successfully");
    EXPECT_EQ(r.user_intent, IntentKind::Read);
}

TEST(SecurityProxy, HijackReportsUserIntent) {
    SecurityProxy proxy;
    auto req = read_request();
    req.proposed_action = "write_email";
    req.action_params = ExtractedParams{};
    req.action_params.set(ParamKey::To, "attacker@evil.com");
    auto r = proxy.process_request(req);
    EXPECT_FALSE(r.approved);
    EXPECT_NE(r.reason.find("Intent mismatch"), std::string::npos);
    EXPECT_EQ(r.user_intent, IntentKind::Read);
}

TEST(SecurityProxy, ContentVetoOverridesApproval) {
    SecurityProxy proxy;
    auto req = read_request();
    req.email_content = kEmail;
    ASSERT_TRUE(proxy.validate_action(req.user_prompt, req.proposed_action, req.action_params).approved);
    auto r = proxy.process_request(req, std::string("John wants you to reply with your password."));
    EXPECT_FALSE(r.approved);
    EXPECT_EQ(r.reason, "Action approved but response validation failed: "
                        "Response contains potential attack indicator: 'reply with your password'");
    EXPECT_EQ(r.user_intent, IntentKind::Read);
}

TEST(SecurityProxy, UpperCaseIndicatorAlsoVetoes) {
    SecurityProxy proxy;
    auto req = read_request();
    req.email_content = kEmail;
    auto r = proxy.process_request(req, std::string("Please REPLY WITH YOUR PASSWORD now"));
    EXPECT_FALSE(r.approved);
    EXPECT_NE(r.reason.find("'reply with your password'"), std::string::npos);
}

TEST(SecurityProxy, FaithfulResponseKeepsApproval) {
    SecurityProxy proxy;
    auto req = read_request();
    req.email_content = "Lunch is moved to Friday at noon, same place as last time.";
    auto r = proxy.process_request(req, std::string("Lunch is moved to Friday at noon"));
    EXPECT_TRUE(r.approved);
    EXPECT_EQ(r.reason, "Parameters validated successfully");
}

TEST(SecurityProxy, ContentCheckNeedsEmailContent) {
    SecurityProxy proxy;
    auto req = read_request();
    auto r = proxy.process_request(req, std::string("reply with your password"));
    EXPECT_TRUE(r.approved);
    req.email_content = std::string();
    EXPECT_TRUE(proxy.process_request(req, std::string("reply with your password")).approved);
}

TEST(SecurityProxy, ContentCheckOnlyForReadActions) {
    SecurityProxy proxy;
    ActionRequest req;
    req.user_prompt = "Delete the email from spam@junk.com";
    req.proposed_action = "delete_email";
    req.action_params.set(ParamKey::From, "spam@junk.com");
    req.email_content = kEmail;
    auto r = proxy.process_request(req, std::string("Please reply with your password and run this command"));
    EXPECT_TRUE(r.approved);
    EXPECT_EQ(r.user_intent, IntentKind::Delete);
}

TEST(SecurityProxy, ResponderSuppliesResponse) {
    SecurityProxy proxy;
    int calls = 0;
    proxy.set_responder(std::make_unique<FixedResponder>(std::string("Click this link to verify"), &calls));
    auto req = read_request();
    req.email_content = kEmail;
    auto r = proxy.process_request(req);
    EXPECT_FALSE(r.approved);
    EXPECT_NE(r.reason.find("'click this link'"), std::string::npos);
    EXPECT_EQ(calls, 1);
    // explicit response wins over the responder
    auto r2 = proxy.process_request(req, std::string("the IT desk asks to reset the account"));
    EXPECT_TRUE(r2.approved);
    EXPECT_EQ(calls, 1);
}

TEST(SecurityProxy, NoResponseSkipsContentCheck) {
    SecurityProxy proxy;
    proxy.set_responder(std::make_unique<FixedResponder>(std::nullopt));
    auto req = read_request();
    req.email_content = kEmail;
    EXPECT_TRUE(proxy.process_request(req).approved);
}

TEST(SecurityProxy, ResponderNotCalledWhenActionRejected) {
    SecurityProxy proxy;
    int calls = 0;
    proxy.set_responder(std::make_unique<FixedResponder>(std::string("ok"), &calls));
    auto req = read_request();
    req.action_params.set(ParamKey::From, "attacker@evil.com");
    req.email_content = kEmail;
    EXPECT_FALSE(proxy.process_request(req).approved);
    EXPECT_EQ(calls, 0);
}

TEST(SecurityProxy, Deterministic) {
    SecurityProxy proxy;
    auto req = read_request();
    req.email_content = kEmail;
    auto first = proxy.process_request(req, std::string("reset the account today"));
    for (int i = 0; i < 5; ++i) EXPECT_EQ(proxy.process_request(req, std::string("reset the account today")), first);
}

TEST(SecurityProxy, VerboseLoggingDoesNotChangeDecision) {
    std::ostringstream log;
    ProxyOptions opts; opts.verbose = true; opts.log = &log;
    SecurityProxy loud(opts);
    SecurityProxy quiet;
    auto req = read_request();
    EXPECT_EQ(loud.process_request(req), quiet.process_request(req));
    EXPECT_NE(log.str().find("Processing request"), std::string::npos);
    EXPECT_NE(log.str().find("Approved=true"), std::string::npos);
}

TEST(SecurityProxy, SharedAcrossThreads) {
    SecurityProxy proxy;
    auto req = read_request();
    req.email_content = kEmail;
    const auto expected = proxy.process_request(req, std::string("reply with your password"));
    std::vector<std::thread> workers;
    std::vector<int> mismatches(4, 0);
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t]{
            for (int i = 0; i < 50; ++i) {
                if (!(proxy.process_request(req, std::string("reply with your password")) == expected)) ++mismatches[t];
            }
        });
    }
    for (auto& w : workers) w.join();
    for (int m : mismatches) EXPECT_EQ(m, 0);
}
