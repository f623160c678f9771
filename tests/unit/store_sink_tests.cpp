#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "swarmcast/core/error.hpp"
#include "swarmcast/gossip/identity.hpp"
#include "swarmcast/sink/gossip_sink.hpp"
#include "swarmcast/store/peer_store.hpp"

namespace {

using swarmcast::Error;
using swarmcast::ErrorCode;

std::filesystem::path fresh_dir(const char* name) {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

void write_file(const std::filesystem::path& p, const std::string& content) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out << content;
}

swarmcast::GossipEvent sample_event() {
  swarmcast::GossipEvent ev{};
  swarmcast::GossipMessage a{};
  a.id = "0123456789abcdef0123456789abcdef";
  a.peer_id = "p1";
  a.peer_display_name = "quick calm otter";
  a.message = "2+2?...4";
  a.timestamp = swarmcast::WallClock::time_point{} + std::chrono::seconds(1700000000);
  a.dataset = "math";
  swarmcast::GossipMessage b = a;
  b.id = "fedcba9876543210fedcba9876543210";
  b.dataset.reset();
  ev.data = {a, b};
  return ev;
}

bool test_directory_store() {
  const auto root = fresh_dir("swarmcast_store_test");
  write_file(root / "3" / "peerA.bin", "abc");
  write_file(root / "3" / "peerB.bin", "");
  write_file(root / "3" / "notes.txt", "ignored");

  auto store = swarmcast::make_directory_store(root);
  const auto rec = store->get(swarmcast::round_key(3));
  if (!rec || rec->size() != 2 || rec->at("peerA").size() != 3 || !rec->at("peerB").empty()) {
    std::cerr << std::format("round 3 should hold peerA and peerB\n");
    return false;
  }
  if (store->get("4")) {
    std::cerr << std::format("absent key should be nullopt\n");
    return false;
  }

  try {
    (void)store->get("../etc");
    std::cerr << std::format("path-like key should be rejected\n");
    return false;
  } catch (const Error& e) {
    if (e.code() != ErrorCode::InvalidArgument) {
      return false;
    }
  }

  auto gone = swarmcast::make_directory_store(root / "missing");
  try {
    (void)gone->get("1");
  } catch (const Error& e) {
    return e.code() == ErrorCode::TransportError;
  }
  std::cerr << std::format("unreachable store root should be a transport error\n");
  return false;
}

bool test_event_json() {
  const auto doc = nlohmann::json::parse(swarmcast::gossip_event_json(sample_event()));
  if (doc.at("type") != "gossip" || doc.at("data").size() != 2) {
    std::cerr << std::format("unexpected event document\n");
    return false;
  }
  const auto& first = doc.at("data")[0];
  if (first.at("timestamp") != "2023-11-14T22:13:20Z" || first.at("dataset") != "math" ||
      first.at("peer_display_name") != "quick calm otter") {
    std::cerr << std::format("unexpected message fields: {}\n", first.dump());
    return false;
  }
  if (doc.at("data")[1].contains("dataset")) {
    std::cerr << std::format("absent dataset must be omitted\n");
    return false;
  }
  return true;
}

bool test_file_sink_appends_json_lines() {
  const auto dir = fresh_dir("swarmcast_sink_test");
  swarmcast::FileSinkConfig cfg{};
  cfg.path = dir / "nested" / "events.jsonl";

  {
    auto sink = swarmcast::make_file_sink(cfg);
    sink->publish(sample_event());
  }
  // Reopening appends rather than truncating.
  {
    auto sink = swarmcast::make_file_sink(cfg);
    sink->publish(sample_event());
  }

  const auto docs = swarmcast::read_sink_documents(cfg.path);
  if (docs.size() != 2 || docs[0] != swarmcast::gossip_event_json(sample_event()) ||
      docs[1] != docs[0]) {
    std::cerr << std::format("sink read back {} documents\n", docs.size());
    return false;
  }
  for (const auto& d : docs) {
    if (d.find('\n') != std::string::npos || !nlohmann::json::accept(d)) {
      std::cerr << std::format("each line must hold one JSON document\n");
      return false;
    }
  }

  try {
    (void)swarmcast::read_sink_documents(dir / "missing.jsonl");
  } catch (const Error& e) {
    return e.code() == ErrorCode::IoError;
  }
  std::cerr << std::format("reading a missing sink should fail\n");
  return false;
}

bool test_null_sink_and_config() {
  auto sink = swarmcast::make_null_sink();
  sink->publish(sample_event());

  try {
    (void)swarmcast::make_file_sink(swarmcast::FileSinkConfig{});
  } catch (const Error& e) {
    return e.code() == ErrorCode::ConfigurationError;
  }
  std::cerr << std::format("empty sink path should be a configuration error\n");
  return false;
}

bool test_identity_names() {
  auto resolver = swarmcast::make_hashed_name_resolver();
  const auto a = resolver->display_name("QmPeerOne");
  const auto again = resolver->display_name("QmPeerOne");
  const auto b = resolver->display_name("QmPeerTwo");
  if (a != again || a.empty()) {
    std::cerr << std::format("display names must be deterministic\n");
    return false;
  }
  if (std::count(a.begin(), a.end(), ' ') != 2 || a == b) {
    std::cerr << std::format("unexpected names '{}' / '{}'\n", a, b);
    return false;
  }
  return resolver->display_name("").empty();
}

}  // namespace

int main() {
  if (!test_directory_store()) {
    return 1;
  }
  if (!test_event_json()) {
    return 1;
  }
  if (!test_file_sink_appends_json_lines()) {
    return 1;
  }
  if (!test_null_sink_and_config()) {
    return 1;
  }
  if (!test_identity_names()) {
    return 1;
  }
  return 0;
}
