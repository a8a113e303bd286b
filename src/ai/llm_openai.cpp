#include <ai-mailguard/ai/llm.hpp>
#include <curl/curl.h>
#include <sstream>
#include <cstdlib>
#include <optional>
#include <string>

namespace mailguard::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::optional<LLMCompletion> OpenAILLMClient::complete(const std::string& prompt) {
    const char* env_key = nullptr;
    if (!m_cfg.api_key_env.empty()) env_key = std::getenv(m_cfg.api_key_env.c_str());
    std::string key = (env_key && *env_key) ? env_key : m_cfg.api_key;
    if (key.empty()) {
        std::string reason = m_cfg.api_key_env.empty() ? "(no-key-direct)" : "(env-missing:" + m_cfg.api_key_env + ")";
        return LLMCompletion{reason, "error"};
    }
    std::string endpoint = m_cfg.endpoint.empty() ? "https://api.openai.com/v1/chat/completions" : m_cfg.endpoint;
    CURL* curl = curl_easy_init();
    if (!curl) return LLMCompletion{"(curl-init-fail)", "error"};
    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)m_cfg.timeout_seconds);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth = std::string("Authorization: Bearer ") + key;
    headers = curl_slist_append(headers, auth.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    std::string system_content = "You are an email assistant. Answer the user's request using only the email text provided. Do not add instructions, links or requests of your own.";
    std::ostringstream body;
    body << "{\"model\":\"" << (m_cfg.model.empty()?"gpt-4o-mini":m_cfg.model) << "\","
         << "\"messages\":[{\"role\":\"system\",\"content\":\"" << escape_json(system_content) << "\"},{\"role\":\"user\",\"content\":\"" << escape_json(prompt) << "\"}],"
         << "\"temperature\":" << m_cfg.temperature << ",\"max_tokens\":" << m_cfg.max_tokens << "}";
    std::string body_str = body.str();
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body_str.c_str());
    auto res = curl_easy_perform(curl);
    long code = 0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK || code/100 != 2) {
        std::string msg = extract_json_string(response, "message");
        return LLMCompletion{"(openai error code=" + std::to_string(code) + (msg.empty()?"":" msg="+msg) + ")", "error"};
    }
    // first choice: choices[0].message.content
    std::string content;
    size_t choices = response.find("\"choices\"");
    if (choices != std::string::npos) {
        size_t message = response.find("\"message\"", choices);
        if (message != std::string::npos) content = extract_json_string(response, "content", message);
    }
    int prompt_tokens = extract_json_int(response, "prompt_tokens");
    int completion_tokens = extract_json_int(response, "completion_tokens");
    if (content.empty()) return LLMCompletion{"(parse-empty)", "error", prompt_tokens, completion_tokens};
    size_t endtrim = content.find_last_not_of(" \t\n\r"); if (endtrim != std::string::npos) content.erase(endtrim+1);
    return LLMCompletion{content, "openai", prompt_tokens, completion_tokens};
}

} // namespace mailguard::ai
