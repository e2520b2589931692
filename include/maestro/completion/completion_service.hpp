#pragma once

#include "../types.hpp"

#include <string>
#include <vector>

namespace maestro {
namespace completion {

/// Output contract requested from the completion service.
enum class ResponseFormat {
    Json,   ///< A single JSON object, nothing else
    Text    ///< Free text (diagnostic queries)
};

struct CompletionRequest {
    std::string model;                 ///< Model identifier
    std::vector<Message> messages;     ///< Role-tagged prompt
    ResponseFormat format = ResponseFormat::Json;
    int max_tokens = 512;
};

struct CompletionResult {
    std::string content;
    int prompt_tokens = 0;
    int completion_tokens = 0;
};

/**
 * @brief Abstract interface for the external completion service used by the router.
 *
 * Implementations must be safe to call from several routing workers at once
 * (serializing internally if the underlying engine is single-threaded).
 *
 * Design principles:
 * - Stateless: each call carries the whole prompt; nothing is cached between calls
 * - Synchronous: complete() blocks until the response is available
 */
class ICompletionService {
public:
    virtual ~ICompletionService() = default;

    /**
     * @brief Produce a completion for the given prompt.
     *
     * @return CompletionResult or an error in the Completion range
     */
    virtual Expected<CompletionResult> complete(const CompletionRequest& request) = 0;
};

} // namespace completion
} // namespace maestro
