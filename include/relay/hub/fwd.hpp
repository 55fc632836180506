#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_hub module

#include <cstdint>

namespace relay_hub {

enum class OverflowPolicy : std::uint8_t;
enum class DispatchMode : std::uint8_t;
enum class HubState : std::uint8_t;
enum class OfferResult : std::uint8_t;

struct SubscriptionId;
struct HubConfig;
struct HubStats;

template<typename T> class Delivery;
template<typename T> class Sink;
template<typename T> class AnchorSink;
template<typename T> class CallbackSink;
template<typename T> class SubscriptionBuffer;
template<typename T> class SubscriptionRegistry;
template<typename T> class Subscription;
template<typename T> class BroadcastCore;
template<typename T> class Inlet;
template<typename T> class Hub;

template<typename In, typename Out> class Transform;
template<typename In, typename Out> class DerivedView;

class ISubscriptionHost;

} // namespace relay_hub
