#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "config_manager.hpp"
#include "detection_types.hpp"

namespace CropDoctor {

struct AdviceContext {
    std::string crop;
    std::string condition;
    SeverityTier severity = SeverityTier::NONE;
    double confidencePercent = 0.0;
    std::optional<std::string> location;
};

/**
 * External natural-language advice capability. Implementations throw
 * AdviceUnavailableError on any failure; callers treat the text as optional.
 */
class AdviceGenerator {
public:
    virtual ~AdviceGenerator() = default;

    virtual std::string generateAdvice(const AdviceContext& context,
                                       std::chrono::milliseconds timeout) = 0;
};

/**
 * Calls a Gemini-style generateContent REST endpoint over HTTPS.
 * Responses are cached by prompt so the same diagnosis yields the same
 * narrative; the oldest fifth of the cache is evicted when it fills up.
 */
class AdviceClient : public AdviceGenerator {
public:
    explicit AdviceClient(const AdviceConfig& config);

    std::string generateAdvice(const AdviceContext& context,
                               std::chrono::milliseconds timeout) override;

    static std::string buildPrompt(const AdviceContext& context);
    nlohmann::json buildRequestBody(const std::string& prompt) const;
    // Throws AdviceUnavailableError when the body has no candidate text.
    static std::string extractText(const std::string& responseBody);

    size_t cachedEntries() const;

private:
    std::optional<std::string> cachedResponse(const std::string& prompt) const;
    void cacheResponse(const std::string& prompt, const std::string& text);

    AdviceConfig config_;

    mutable std::mutex cacheMutex_;
    std::list<std::string> cacheOrder_;
    std::unordered_map<std::string, std::string> cache_;
};

} // namespace CropDoctor
