#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace relay_probe::nostr::protocol {

/// NIP numbers inspected by compliance scoring
inline constexpr int nip_basic_protocol = 1;
inline constexpr int nip_authentication = 42;
inline constexpr int nip_event_counts = 45;

/**
 * @brief Signed Nostr event as supplied by the caller.
 *
 * The engine never signs or verifies events; it only needs the id for
 * acknowledgement correlation and round-trips every other field unchanged.
 */
struct event_data
{
  std::string id;///< Event ID (32-byte hex hash)
  std::string pubkey;///< Public key of event creator (32-byte hex)
  std::uint64_t created_at{};///< Unix timestamp
  std::uint32_t kind{};///< Event kind identifier
  std::vector<std::vector<std::string>> tags;///< Event tags (arbitrary string arrays)
  std::string content;///< Event content
  std::string sig;///< Schnorr signature (64-byte hex)

  /**
   * @brief Deserializes event data from byte array.
   *
   * @param bytes Raw bytes containing JSON event data
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(std::span<const std::byte> bytes) -> std::optional<event_data>;

  /**
   * @brief Deserializes event data from JSON string.
   *
   * @param json JSON string
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<event_data>;

  /**
   * @brief Converts the event to its NIP-01 JSON object form.
   */
  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

/**
 * @brief Nostr OK response message.
 *
 * Sent by relays to indicate acceptance/rejection of a submitted event.
 */
struct ok
{
  std::string event_id;///< ID of the event this responds to
  bool accepted{};///< Whether the event was accepted
  std::string message;///< Human-readable status message

  /**
   * @brief Deserializes OK message from JSON.
   *
   * @param json JSON string in format ["OK", event_id, accepted, message]
   * @return Parsed ok or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<ok>;
};

/**
 * @brief Nostr REQ subscription request.
 */
struct req
{
  std::string subscription_id;///< Unique identifier for this subscription
  nlohmann::json filters;///< Filter criteria (NIP-01 format)

  /**
   * @brief Serializes REQ to JSON string.
   *
   * @return JSON string in format ["REQ", subscription_id, filters]
   */
  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Nostr CLOSE message, ends a subscription.
 */
struct close
{
  std::string subscription_id;

  /// @return JSON string in format ["CLOSE", subscription_id]
  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Client-to-relay EVENT message.
 */
struct event
{
  event_data data;///< The event to publish

  /**
   * @brief Serializes event to JSON string.
   *
   * @return JSON string in format ["EVENT", event_data]
   */
  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Relay information document (NIP-11).
 *
 * Only the fields relevant to compliance scoring are extracted.
 */
struct relay_document
{
  std::optional<std::vector<int>> supported_nips;
  std::optional<std::string> software;
  std::optional<std::string> version;

  /**
   * @brief Deserializes a NIP-11 document.
   *
   * Missing or mistyped fields stay unset; a body that is not a JSON object fails.
   *
   * @param json Response body
   * @return Parsed document or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<relay_document>;
};

/// Maximum allowed subscription ID length
constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Validates a subscription ID.
 *
 * @param subscription_id ID to validate
 * @throws std::invalid_argument if ID is empty or exceeds maximum length
 */
inline auto validate_subscription_id(const std::string &subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("Subscription ID cannot be empty"); }
  if (subscription_id.length() > max_subscription_id_length) {
    throw std::invalid_argument("Subscription ID exceeds maximum length of 64 characters");
  }
}

}// namespace relay_probe::nostr::protocol
