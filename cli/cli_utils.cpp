#include "cli_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#ifdef RULESTACK_USE_CURL
#include <curl/curl.h>
#endif

namespace rulestack::cli {

namespace {

#ifdef RULESTACK_USE_CURL
/// Appends curl response chunks into the caller-owned buffer.
/// MUST return the full byte count or curl will treat it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string fetch_url(const std::string& url, int timeout_ms) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  std::string buffer;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "rulestack/0.1");
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  CURLcode res = curl_easy_perform(curl);
  curl_easy_cleanup(curl);
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  return buffer;
}
#endif

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

bool is_url(const std::string& value) {
  return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

std::string load_text_input(const std::string& input, int timeout_ms) {
  if (is_url(input)) {
#ifdef RULESTACK_USE_CURL
    return fetch_url(input, timeout_ms);
#else
    (void)timeout_ms;
    throw std::runtime_error("URL fetching is disabled (libcurl not available)");
#endif
  }
  return read_file(input);
}

std::string build_tokens_json(const std::vector<StyledToken>& tokens) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& token : tokens) {
    if (token.style == kStyleWhitespace) continue;
    out.push_back({{"line", token.line},
                   {"start", token.start},
                   {"end", token.end},
                   {"text", token.text},
                   {"style", token.style},
                   {"kind", token.kind},
                   {"step", token.step},
                   {"depth", token.depth}});
  }
  return out.dump(2);
}

std::string build_definitions_json(const std::vector<NamedFrame>& frames) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& frame : frames) {
    out.push_back({{"kind", frame.kind},
                   {"name", frame.name},
                   {"type", frame.type},
                   {"line", frame.line}});
  }
  return out.dump(2);
}

}  // namespace rulestack::cli
