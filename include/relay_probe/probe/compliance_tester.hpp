#pragma once

#include <relay_probe/async/join_all.hpp>
#include <relay_probe/concepts/relay_info_source.hpp>
#include <relay_probe/concepts/websocket_stream.hpp>
#include <relay_probe/core/probe_config.hpp>
#include <relay_probe/core/results.hpp>
#include <relay_probe/nostr/protocol.hpp>
#include <relay_probe/probe/health_probe.hpp>

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace relay_probe::probe {

/**
 * @brief Scores relays for protocol conformance from their NIP-11 document and repeated pings.
 *
 * @tparam Stream Transport used for the pings
 * @tparam Info Source of relay information documents
 */
template<concepts::websocket_stream Stream, concepts::relay_info_source Info> class compliance_tester
{
public:
  compliance_tester(session::stream_factory<Stream> factory, Info &info_source, core::probe_config config)
    : health_(std::move(factory), config), info_source_(info_source)
  {}

  /**
   * @brief Scores a single relay.
   *
   * A failed metadata fetch leaves every NIP flag false. Pings run one after
   * another, exactly core::compliance_trials of them, without retries.
   *
   * @param url Relay URI
   * @return Compliance result; never throws
   */
  auto test_compliance(std::string url) -> boost::asio::awaitable<core::compliance_result>
  {
    core::compliance_result result{ .url = url, .tested = core::compliance_trials };

    auto info = co_await info_source_.fetch(url);
    if (info.status == session::connection_state::connected and info.supported_nips) {
      const auto &nips = *info.supported_nips;
      result.nip01_compliant = std::ranges::find(nips, nostr::protocol::nip_basic_protocol) != nips.end();
      result.supports_auth = std::ranges::find(nips, nostr::protocol::nip_authentication) != nips.end();
      result.supports_count = std::ranges::find(nips, nostr::protocol::nip_event_counts) != nips.end();
    } else if (info.error_message) {
      spdlog::warn("[compliance] No relay information for {}: {}", url, *info.error_message);
    }

    int successes = 0;
    double latency_sum = 0;
    for (int trial = 0; trial < core::compliance_trials; ++trial) {
      const auto ping = co_await health_.ping(url);
      if (ping.success) {
        ++successes;
        latency_sum += ping.latency_ms;
      }
    }

    result.success_ratio = static_cast<double>(successes) / static_cast<double>(core::compliance_trials);
    result.average_latency_ms = successes > 0 ? latency_sum / successes : 0.0;

    spdlog::info("[compliance] {} nip01={} auth={} count={} ratio={:.2f}",
      url,
      result.nip01_compliant,
      result.supports_auth,
      result.supports_count,
      result.success_ratio);
    co_return result;
  }

  /**
   * @brief Scores several relays concurrently.
   *
   * @param urls Relay URIs
   * @return One result per URI, in input order
   */
  auto compare(std::vector<std::string> urls) -> boost::asio::awaitable<std::vector<core::compliance_result>>
  {
    std::vector<boost::asio::awaitable<core::compliance_result>> tasks;
    tasks.reserve(urls.size());
    for (auto &url : urls) { tasks.push_back(test_compliance(std::move(url))); }

    co_return co_await async::join_all(std::move(tasks));
  }

private:
  health_probe<Stream> health_;
  Info &info_source_;
};

}// namespace relay_probe::probe
