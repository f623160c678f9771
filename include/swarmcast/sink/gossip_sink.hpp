#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "swarmcast/core/types.hpp"

namespace swarmcast {

// External observability sink. publish() is fire-and-forget from the
// pipeline's point of view: it may throw, and the caller only logs.
class IGossipSink {
 public:
  virtual ~IGossipSink() = default;

  virtual void publish(const GossipEvent& event) = 0;
};

struct FileSinkConfig {
  std::filesystem::path path{};
};

// JSON document: {"type": ..., "data": [{id, peer_id, peer_display_name,
// message, timestamp, dataset?}]} with RFC 3339 UTC timestamps.
std::string gossip_event_json(const GossipEvent& event);

// Appends one JSON document per line (JSON Lines).
std::unique_ptr<IGossipSink> make_file_sink(const FileSinkConfig& cfg);

// Drops every event; used when publishing is disabled by configuration.
std::unique_ptr<IGossipSink> make_null_sink();

// Reads back the documents of a sink file; blank lines are skipped.
std::vector<std::string> read_sink_documents(const std::filesystem::path& path);

}  // namespace swarmcast
