#include <ai-mailguard/config.hpp>
#include <ai-mailguard/util/text.hpp>
#include <fstream>
#include <cstdlib>
#include <stdexcept>

namespace mailguard {

using util::trim;

static bool to_bool(const std::string& v){ return v=="1"||v=="true"||v=="on"; }

void parse_config(std::istream& in, GuardConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('='); if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq+1));
        if (key=="verbose") cfg.verbose = to_bool(val);
        else if (key=="color") cfg.color = to_bool(val);
        else if (key=="llm_enabled") cfg.llm.enabled = to_bool(val);
        else if (key=="llm_provider") cfg.llm.provider = val;
        else if (key=="llm_model") cfg.llm.model = val;
        else if (key=="llm_endpoint") cfg.llm.endpoint = val;
        else if (key=="llm_api_key_env") cfg.llm.api_key_env = val;
        else if (key=="llm_api_key") cfg.llm.api_key = val;
        else if (key=="llm_stub_file") cfg.llm.stub_file = val;
        else if (key=="llm_max_tokens") { try { cfg.llm.max_tokens = std::stoi(val); } catch (const std::exception&) { /* keep default */ } }
        else if (key=="llm_temperature") { try { cfg.llm.temperature = std::stod(val); } catch (const std::exception&) { /* keep default */ } }
        else if (key=="llm_timeout") { try { cfg.llm.timeout_seconds = std::stoi(val); } catch (const std::exception&) { /* keep default */ } }
    }
}

bool load_config_file(const std::string& path, GuardConfig& cfg) {
    if (path.empty()) return false;
    std::ifstream in(path); if (!in) return false;
    parse_config(in, cfg);
    return true;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.ai-mailguardrc";
}

} // namespace mailguard
