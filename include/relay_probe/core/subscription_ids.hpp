#pragma once

#include <string>
#include <string_view>

namespace relay_probe::core {

/**
 * @brief Generates a subscription id unique to this probe run.
 *
 * The id is `<prefix>_<uuid>` and always satisfies the protocol's 64 character
 * limit; an over-long prefix is truncated.
 *
 * @param prefix Human-readable tag identifying the probe (e.g. "health_check")
 * @return Subscription id such as "health_check_550e8400-e29b-41d4-a716-446655440000"
 */
[[nodiscard]] auto make_subscription_id(std::string_view prefix) -> std::string;

}// namespace relay_probe::core
