#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>

#include "primitives/block.hpp"
#include "primitives/hash.hpp"

namespace sps::node {

enum class FeedEventType {
  kConnect,
  kDisconnect,
  // The record could not be decoded. Carried through so the tracker halts
  // instead of silently skipping a block.
  kMalformed,
};

struct FeedEvent {
  FeedEventType type{FeedEventType::kMalformed};
  // Populated for kConnect.
  primitives::CBlock block{};
  // Populated for kConnect and kDisconnect.
  std::uint32_t height{0};
  primitives::Hash256 hash{};
  std::string error;
};

// One feed record per line:
//   {"type":"connect","height":N,"hash":H,"prev":H,
//    "txs":[{"hex":RAW,"prevouts":[SPK,...]}, ...]}
//   {"type":"disconnect","height":N,"hash":H}
// Hashes are in display (byte-reversed) hex. Each prevouts entry is the
// scriptPubKey of the output spent by the matching input; a coinbase may
// omit them. An optional "txid" must agree with the decoded transaction.
// Returns false and yields a kMalformed event on any structural problem.
bool ParseFeedLine(const std::string& line, FeedEvent* out);
std::string EncodeFeedEvent(const FeedEvent& event);

enum class FeedWaitResult {
  kEvent,
  kTimeout,
  kStopped,
  kClosed,
};

// Ordered hand-off between the upstream reader and the chain tracker.
class BlockFeed {
 public:
  // Invoked on the producer thread for every disconnect as it is pushed, so
  // a consumer can cancel in-flight work for that block.
  using DisconnectObserver = std::function<void(const FeedEvent& event)>;

  static constexpr std::size_t kDefaultCapacity = 64;

  explicit BlockFeed(std::size_t capacity = kDefaultCapacity);

  // Waits while `capacity` events are pending. Returns false, dropping the
  // event, if `stop` is requested first.
  bool Push(FeedEvent event, std::stop_token stop = {});
  // Blocks until an event is available, the timeout lapses, `stop` is
  // requested, or the feed is closed and drained.
  FeedWaitResult WaitNext(std::stop_token stop, std::chrono::milliseconds timeout,
                          FeedEvent* out);
  void Close();
  bool Closed() const;
  std::size_t Pending() const;
  void SetDisconnectObserver(DisconnectObserver observer);

 private:
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::condition_variable_any space_cv_;
  std::size_t capacity_;
  std::deque<FeedEvent> queue_;
  bool closed_{false};
  DisconnectObserver observer_;
};

// Reads newline-delimited feed records from `fd` until end of input or stop,
// pushing every record (malformed ones included) and closing the feed at the
// end. Polls so that a stop request is honoured while the input is idle, and
// stops reading while the feed is full.
void RunFeedReader(int fd, BlockFeed* feed, std::stop_token stop);

}  // namespace sps::node
