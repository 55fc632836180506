#pragma once

/// @file hub.hpp
/// @brief Main include header for relay_hub
///
/// relay_hub turns a single live, push-driven source into a shared channel:
/// - One producer pushes through an Inlet
/// - Any number of consumers attach and detach independently
/// - Late subscribers never see earlier elements
/// - A keep-alive anchor keeps the stream alive between subscribers
/// - Derived views compute a transformation once for all consumers
///
/// ## Quick Start
///
/// ```cpp
/// relay_hub::Hub<Tick> hub(relay_hub::HubConfig{}.with_name("ticks"));
/// auto inlet = hub.take_inlet().unwrap();
///
/// auto sub = hub.subscribe();
/// inlet.push(Tick{...});
///
/// auto delivery = sub.next();
/// if (delivery.is_element()) {
///     // Handle delivery.value()
/// }
/// ```
///
/// ### Derived view (shared computation)
/// ```cpp
/// relay_hub::DerivedView<Tick, double> averages(hub,
///     relay_hub::make_window<Tick, double>(10, 1, average_price));
/// auto sub = averages.subscribe();
/// ```

#include "fwd.hpp"
#include "types.hpp"
#include "delivery.hpp"
#include "sink.hpp"
#include "subscription_buffer.hpp"
#include "registry.hpp"
#include "subscription.hpp"
#include "broadcast_core.hpp"
#include "inlet.hpp"
#include "live_hub.hpp"
#include "derived_view.hpp"

namespace relay_hub {

/// Prelude - commonly used types
namespace prelude {
    using relay_hub::OverflowPolicy;
    using relay_hub::DispatchMode;
    using relay_hub::HubState;
    using relay_hub::HubConfig;
    using relay_hub::HubStats;
    using relay_hub::SubscriptionId;
    using relay_hub::Delivery;
    using relay_hub::Subscription;
    using relay_hub::Inlet;
    using relay_hub::Hub;
    using relay_hub::Transform;
    using relay_hub::DerivedView;
} // namespace prelude

} // namespace relay_hub
