#pragma once

#include "event.hpp"
#include "filter.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace maestro {
namespace network {

using SubscriptionId = uint64_t;

/**
 * @brief Signs event ids on behalf of one identity.
 */
class ISigner {
public:
    virtual ~ISigner() = default;

    /// Hex x-only public key of this identity.
    virtual std::string pubkey() const = 0;

    /// Hex signature over the 32-byte event id.
    virtual Expected<std::string> sign(const std::string& event_id) = 0;
};

/**
 * @brief Abstract publish/subscribe event network.
 *
 * Delivery is at-least-once: the same event may reach a subscription more
 * than once (redundant relays), and in any order relative to other events.
 * Callbacks run on a network-owned thread.
 */
class IEventNetwork {
public:
    using EventCallback = std::function<void(const Event&)>;

    virtual ~IEventNetwork() = default;

    virtual Expected<void> publish(const Event& event) = 0;
    virtual Expected<SubscriptionId> subscribe(const std::vector<Filter>& filters, EventCallback callback) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

/**
 * @brief Fill in pubkey, id and signature of an unsigned event.
 */
inline Expected<Event> finalize_event(Event event, ISigner& signer) {
    event.pubkey = signer.pubkey();
    if (event.created_at == 0) {
        event.created_at = now_seconds();
    }

    auto id = compute_event_id(event);
    if (!id) {
        return tl::unexpected(id.error());
    }
    event.id = *id;

    auto sig = signer.sign(event.id);
    if (!sig) {
        return tl::unexpected(sig.error());
    }
    event.sig = *sig;
    return event;
}

} // namespace network
} // namespace maestro
