// AI-MailGuard command-line driver
#include <ai-mailguard/config.hpp>
#include <ai-mailguard/core/security_proxy.hpp>
#include <ai-mailguard/ai/llm.hpp>
#include <ai-mailguard/ai/responder.hpp>
#include <ai-mailguard/io/json_request.hpp>
#include <ai-mailguard/util/text.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace mailguard;

static GuardConfig g_cfg;

static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void usage(){
    std::cerr << "Usage: ai-mailguard [--config <file>] [-v|--verbose] [--demo] [requests.jsonl|-]\n"
              << "  Reads one JSON request per line and prints one JSON decision per line.\n";
}

struct DemoCase {
    const char* title;
    ActionRequest request;
};

static std::vector<DemoCase> demo_cases(){
    std::vector<DemoCase> cases;
    {
        ActionRequest r; r.user_prompt = "Read the latest email from john@example.com"; r.proposed_action = "read_email";
        r.action_params.set(ParamKey::From, "john@example.com");
        cases.push_back({"Valid read request", r});
    }
    {
        ActionRequest r; r.user_prompt = "Read the latest email from john@example.com"; r.proposed_action = "write_email";
        r.action_params.set(ParamKey::To, "attacker@evil.com"); r.action_params.set(ParamKey::Subject, "Sensitive data");
        cases.push_back({"Hijacked write request", r});
    }
    {
        ActionRequest r; r.user_prompt = "Read emails from john@example.com with subject 'Project Update'"; r.proposed_action = "read_email";
        r.action_params.set(ParamKey::From, "attacker@evil.com"); r.action_params.set(ParamKey::Subject, "Project Update");
        cases.push_back({"Parameter mismatch attack", r});
    }
    return cases;
}

static int run_demo(const SecurityProxy& proxy){
    int n = 1;
    for (auto& c : demo_cases()) {
        auto result = proxy.process_request(c.request);
        std::cout << "Example " << n++ << " - " << c.title << ": "
                  << (result.approved ? apply_color("APPROVED","32") : apply_color("REJECTED","31")) << "\n"
                  << io::to_json(result) << "\n\n";
    }
    return 0;
}

static int run_stream(const SecurityProxy& proxy, std::istream& in){
    int status = 0; std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = util::trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto parsed = io::parse_request_json(line);
        if (!parsed.valid) {
            std::cerr << "Line " << lineno << ": invalid request (" << parsed.error << ")" << std::endl;
            status = 2;
            continue;
        }
        if (g_cfg.verbose && !parsed.dropped_params.empty()) {
            std::cerr << "[mailguard] line " << lineno << ": ignoring unconstrained params:";
            for (auto& k : parsed.dropped_params) std::cerr << " " << k;
            std::cerr << "\n";
        }
        auto result = proxy.process_request(parsed.request, parsed.proposed_response);
        std::cout << io::to_json(result) << "\n";
    }
    return status;
}

int main(int argc, char* argv[]){
    std::string config_path = default_config_path();
    std::string input;
    bool demo = false, verbose_flag = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (a == "-v" || a == "--verbose") verbose_flag = true;
        else if (a == "--demo") demo = true;
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else if (!a.empty() && a[0] == '-' && a != "-") { std::cerr << "Unknown option: " << a << "\n"; usage(); return 1; }
        else input = a;
    }
    if (!load_config_file(config_path, g_cfg) && verbose_flag) {
        std::cerr << "[mailguard] no config at " << (config_path.empty() ? "<unset>" : config_path) << ", using defaults\n";
    }
    if (verbose_flag) g_cfg.verbose = true;

    ProxyOptions opts; opts.verbose = g_cfg.verbose;
    SecurityProxy proxy(opts);
    if (g_cfg.llm.enabled) {
        if (g_cfg.verbose) std::cerr << "[mailguard] responder provider=" << g_cfg.llm.provider << " model=" << (g_cfg.llm.model.empty() ? "<default>" : g_cfg.llm.model) << "\n";
        proxy.set_responder(std::make_unique<ai::LLMResponder>(ai::make_llm(g_cfg.llm)));
    }

    if (demo) return run_demo(proxy);
    if (input.empty() || input == "-") return run_stream(proxy, std::cin);
    std::ifstream in(input);
    if (!in) { std::perror("open requests"); return 1; }
    return run_stream(proxy, in);
}
