#pragma once

#include <string>

namespace medscribe {
namespace refine {

/**
 * External generative-text service: one prompt in, one text out.
 */
class GenerativeService {
public:
    virtual ~GenerativeService() = default;

    /**
     * @throws utils::GenerationException on any service or transport failure
     */
    virtual std::string generate(const std::string& prompt) = 0;

    /**
     * False when the service is not configured; callers skip it entirely.
     */
    virtual bool isAvailable() const = 0;

    virtual std::string getName() const = 0;
};

} // namespace refine
} // namespace medscribe
