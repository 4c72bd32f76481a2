#include <relay_probe/nostr/protocol.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <limits>

namespace relay_probe::nostr::protocol {

auto event_data::deserialize(std::span<const std::byte> bytes) -> std::optional<event_data>
{
  std::string json_str;
  json_str.resize(bytes.size());
  std::ranges::transform(bytes, json_str.begin(), [](std::byte byte_val) { return std::bit_cast<char>(byte_val); });
  return deserialize(json_str);
}

auto event_data::deserialize(const std::string &json) -> std::optional<event_data>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (!json_obj.is_object()) { return std::nullopt; }

    event_data event;

    if (!json_obj.contains("id") || !json_obj["id"].is_string()) { return std::nullopt; }
    event.id = json_obj["id"].get<std::string>();

    if (!json_obj.contains("pubkey") || !json_obj["pubkey"].is_string()) { return std::nullopt; }
    event.pubkey = json_obj["pubkey"].get<std::string>();

    if (!json_obj.contains("created_at") || !json_obj["created_at"].is_number_unsigned()) { return std::nullopt; }
    event.created_at = json_obj["created_at"].get<std::uint64_t>();

    if (!json_obj.contains("kind") || !json_obj["kind"].is_number_unsigned()) { return std::nullopt; }
    const auto kind = json_obj["kind"].get<std::uint64_t>();
    if (kind > std::numeric_limits<std::uint32_t>::max()) { return std::nullopt; }
    event.kind = static_cast<std::uint32_t>(kind);

    if (!json_obj.contains("content") || !json_obj["content"].is_string()) { return std::nullopt; }
    event.content = json_obj["content"].get<std::string>();

    if (!json_obj.contains("sig") || !json_obj["sig"].is_string()) { return std::nullopt; }
    event.sig = json_obj["sig"].get<std::string>();

    if (json_obj.contains("tags")) {
      if (!json_obj["tags"].is_array()) { return std::nullopt; }
      for (const auto &tag_json : json_obj["tags"]) {
        if (!tag_json.is_array()) { return std::nullopt; }
        std::vector<std::string> tag;
        for (const auto &element : tag_json) {
          if (!element.is_string()) { return std::nullopt; }
          tag.push_back(element.get<std::string>());
        }
        event.tags.push_back(std::move(tag));
      }
    }

    return event;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto event_data::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj;

  json_obj["id"] = id;
  json_obj["pubkey"] = pubkey;
  json_obj["created_at"] = created_at;
  json_obj["kind"] = kind;
  json_obj["content"] = content;
  json_obj["sig"] = sig;

  json_obj["tags"] = nlohmann::json::array();
  for (const auto &tag : tags) {
    nlohmann::json tag_json = nlohmann::json::array();
    std::ranges::copy(tag, std::back_inserter(tag_json));
    json_obj["tags"].push_back(tag_json);
  }

  return json_obj;
}

auto ok::deserialize(const std::string &json) -> std::optional<ok>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (!json_obj.is_array() || json_obj.size() < 3) { return std::nullopt; }
    if (!json_obj[0].is_string() || json_obj[0].get<std::string>() != "OK") { return std::nullopt; }
    if (!json_obj[1].is_string()) { return std::nullopt; }
    if (!json_obj[2].is_boolean()) { return std::nullopt; }

    ok result;
    result.event_id = json_obj[1].get<std::string>();
    result.accepted = json_obj[2].get<bool>();
    result.message = (json_obj.size() > 3 && json_obj[3].is_string()) ? json_obj[3].get<std::string>() : "";

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto req::serialize() const -> std::string
{
  validate_subscription_id(subscription_id);

  nlohmann::json json_array = nlohmann::json::array();
  json_array.push_back("REQ");
  json_array.push_back(subscription_id);
  json_array.push_back(filters);
  return json_array.dump();
}

auto close::serialize() const -> std::string
{
  validate_subscription_id(subscription_id);

  nlohmann::json json_array = nlohmann::json::array();
  json_array.push_back("CLOSE");
  json_array.push_back(subscription_id);
  return json_array.dump();
}

auto event::serialize() const -> std::string
{
  nlohmann::json message = nlohmann::json::array();
  message.push_back("EVENT");
  message.push_back(data.to_json());
  return message.dump();
}

auto relay_document::deserialize(const std::string &json) -> std::optional<relay_document>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (!json_obj.is_object()) { return std::nullopt; }

    relay_document document;

    if (json_obj.contains("supported_nips") and json_obj["supported_nips"].is_array()) {
      std::vector<int> nips;
      for (const auto &nip : json_obj["supported_nips"]) {
        if (nip.is_number_integer()) { nips.push_back(nip.get<int>()); }
      }
      document.supported_nips = std::move(nips);
    }
    if (json_obj.contains("software") and json_obj["software"].is_string()) {
      document.software = json_obj["software"].get<std::string>();
    }
    if (json_obj.contains("version") and json_obj["version"].is_string()) {
      document.version = json_obj["version"].get<std::string>();
    }

    return document;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

}// namespace relay_probe::nostr::protocol
