#include "advice_generator.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <httplib.h>

#include "errors.hpp"

namespace CropDoctor {

AdviceClient::AdviceClient(const AdviceConfig& config) : config_(config) {}

std::string AdviceClient::buildPrompt(const AdviceContext& context) {
    std::ostringstream prompt;
    prompt << "You are an agricultural advisor helping a smallholder farmer.\n\n"
           << "A leaf photo of a " << context.crop << " plant was diagnosed with "
           << context.condition << " (" << std::fixed << std::setprecision(1)
           << context.confidencePercent << "% confidence, severity: "
           << severityToString(context.severity) << ").\n";
    if (context.location && !context.location->empty()) {
        prompt << "The farm is located in " << *context.location << ".\n";
    }
    prompt << "\nGive short, practical advice (max 150 words):\n"
           << "- what to do in the next 48 hours\n"
           << "- affordable treatment options available to small farmers\n"
           << "- how to stop it spreading to other plants\n"
           << "Use simple words and bullet points.";
    return prompt.str();
}

nlohmann::json AdviceClient::buildRequestBody(const std::string& prompt) const {
    // temperature 0 keeps the narrative stable for the same diagnosis
    return {
        {"contents", nlohmann::json::array({
            {{"parts", nlohmann::json::array({{{"text", prompt}}})}}
        })},
        {"generationConfig", {
            {"temperature", 0},
            {"topP", 1},
            {"topK", 1},
            {"maxOutputTokens", config_.max_output_tokens}
        }}
    };
}

std::string AdviceClient::extractText(const std::string& responseBody) {
    nlohmann::json json = nlohmann::json::parse(responseBody, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw AdviceUnavailableError("Advice service returned malformed JSON");
    }

    try {
        const auto& parts = json.at("candidates").at(0).at("content").at("parts");
        std::string text;
        for (const auto& part : parts) {
            if (part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
        if (text.empty()) {
            throw AdviceUnavailableError("Advice service returned an empty answer");
        }
        return text;
    } catch (const nlohmann::json::exception& e) {
        throw AdviceUnavailableError(std::string("Unexpected advice response layout: ") + e.what());
    }
}

std::optional<std::string> AdviceClient::cachedResponse(const std::string& prompt) const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto it = cache_.find(prompt);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

void AdviceClient::cacheResponse(const std::string& prompt, const std::string& text) {
    if (config_.cache_size == 0) return;

    std::lock_guard<std::mutex> lock(cacheMutex_);
    if (cache_.count(prompt)) return;

    if (cache_.size() >= config_.cache_size) {
        size_t evict = std::max<size_t>(1, config_.cache_size / 5);
        while (evict-- > 0 && !cacheOrder_.empty()) {
            cache_.erase(cacheOrder_.front());
            cacheOrder_.pop_front();
        }
    }
    cacheOrder_.push_back(prompt);
    cache_[prompt] = text;
}

size_t AdviceClient::cachedEntries() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cache_.size();
}

std::string AdviceClient::generateAdvice(const AdviceContext& context, std::chrono::milliseconds timeout) {
    if (config_.api_key.empty()) {
        throw AdviceUnavailableError("No API key configured for the advice service");
    }
    if (timeout.count() <= 0) {
        throw AdviceUnavailableError("No time left for the advice request");
    }

    const std::string prompt = buildPrompt(context);
    if (auto cached = cachedResponse(prompt)) {
        return *cached;
    }

    httplib::Client client(config_.endpoint);
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);

    httplib::Headers headers = {{"x-goog-api-key", config_.api_key}};
    const std::string path = "/v1beta/models/" + config_.model + ":generateContent";
    const std::string body = buildRequestBody(prompt).dump();

    auto res = client.Post(path, headers, body, "application/json");
    if (!res) {
        throw AdviceUnavailableError("Advice service unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw AdviceUnavailableError("Advice service answered HTTP " + std::to_string(res->status));
    }

    std::string text = extractText(res->body);
    cacheResponse(prompt, text);
    return text;
}

} // namespace CropDoctor
