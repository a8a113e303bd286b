#include <ai-mailguard/ai/llm.hpp>
#include <curl/curl.h>
#include <sstream>
#include <string>
#include <optional>

namespace mailguard::ai {

static size_t curl_write_cb_ollama(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* out = static_cast<std::string*>(userdata); out->append(ptr, size*nmemb); return size*nmemb;
}

std::optional<LLMCompletion> OllamaLLMClient::complete(const std::string& prompt) {
    std::string endpoint = m_cfg.endpoint.empty() ? "http://localhost:11434/api/generate" : m_cfg.endpoint;
    CURL* curl = curl_easy_init(); if(!curl) return LLMCompletion{"(curl-init-fail)", "error"};
    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb_ollama);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)m_cfg.timeout_seconds);
    struct curl_slist* headers=nullptr; headers=curl_slist_append(headers, "Content-Type: application/json"); curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    // Body for /api/generate: {"model":"<model>","prompt":"...","stream":false,"options":{...}}
    std::ostringstream body;
    body << "{\"model\":\"" << (m_cfg.model.empty()?"llama3":m_cfg.model) << "\",\"prompt\":\"" << escape_json(prompt)
         << "\",\"stream\":false,\"options\":{\"temperature\":" << m_cfg.temperature << ",\"num_predict\":" << m_cfg.max_tokens << "}}";
    std::string b=body.str(); curl_easy_setopt(curl, CURLOPT_POST, 1L); curl_easy_setopt(curl, CURLOPT_POSTFIELDS, b.c_str());
    auto res = curl_easy_perform(curl); long code=0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE,&code); curl_slist_free_all(headers); curl_easy_cleanup(curl);
    if(res!=CURLE_OK || code/100!=2){ return LLMCompletion{"(ollama error code="+std::to_string(code)+")","error"}; }
    std::string text = extract_json_string(response, "response");
    if(text.empty()) return LLMCompletion{"(parse-empty)","error"};
    return LLMCompletion{text, "ollama", extract_json_int(response, "prompt_eval_count"), extract_json_int(response, "eval_count")};
}

} // namespace mailguard::ai
