#include "node/block_feed.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <optional>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef _WIN32
#include <poll.h>
#include <unistd.h>
#endif

#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace sps::node {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr int kPollIntervalMs = 200;

bool Fail(FeedEvent* out, std::string message) {
  out->type = FeedEventType::kMalformed;
  out->block = primitives::CBlock{};
  out->error = std::move(message);
  return false;
}

bool ReadHash(const nlohmann::json& doc, const char* field, primitives::Hash256* out) {
  if (!doc.contains(field) || !doc.at(field).is_string()) {
    return false;
  }
  return primitives::ParseDisplayHash(doc.at(field).get<std::string>(), out);
}

bool ParseTransaction(const nlohmann::json& item, primitives::CTransaction* tx,
                      std::string* error) {
  if (!item.is_object() || !item.contains("hex") || !item.at("hex").is_string()) {
    *error = "transaction missing hex";
    return false;
  }
  std::vector<std::uint8_t> raw;
  if (!util::HexDecode(item.at("hex").get<std::string>(), &raw)) {
    *error = "transaction hex is not valid hex";
    return false;
  }
  std::size_t offset = 0;
  if (!primitives::serialize::DeserializeTransaction(raw, &offset, tx) || offset != raw.size()) {
    *error = "transaction does not decode";
    return false;
  }
  tx->txid = primitives::ComputeTxId(*tx);
  if (item.contains("txid")) {
    primitives::Hash256 claimed{};
    if (!ReadHash(item, "txid", &claimed) || claimed != tx->txid) {
      *error = "txid does not match transaction " + primitives::HashToDisplayHex(tx->txid);
      return false;
    }
  }
  const auto prevouts = item.contains("prevouts") ? item.at("prevouts") : nlohmann::json::array();
  if (!prevouts.is_array()) {
    *error = "prevouts must be an array";
    return false;
  }
  if (prevouts.empty() && tx->IsCoinbase()) {
    return true;
  }
  if (prevouts.size() != tx->vin.size()) {
    *error = "prevouts count does not match inputs of " + primitives::HashToDisplayHex(tx->txid);
    return false;
  }
  for (std::size_t i = 0; i < prevouts.size(); ++i) {
    if (!prevouts[i].is_string() ||
        !util::HexDecode(prevouts[i].get<std::string>(), &tx->vin[i].prevout_script_pubkey)) {
      *error = "prevout script " + std::to_string(i) + " is not valid hex";
      return false;
    }
  }
  return true;
}

}  // namespace

bool ParseFeedLine(const std::string& line, FeedEvent* out) {
  *out = FeedEvent{};
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(line);
  } catch (const nlohmann::json::exception& ex) {
    return Fail(out, std::string("invalid JSON: ") + ex.what());
  }
  if (!doc.is_object() || !doc.contains("type") || !doc.at("type").is_string()) {
    return Fail(out, "record has no type");
  }
  if (!doc.contains("height") || !doc.at("height").is_number_unsigned() ||
      doc.at("height").get<std::uint64_t>() > 0xFFFFFFFFULL) {
    return Fail(out, "record has no valid height");
  }
  out->height = doc.at("height").get<std::uint32_t>();
  if (!ReadHash(doc, "hash", &out->hash)) {
    return Fail(out, "record has no valid hash");
  }
  const auto type = doc.at("type").get<std::string>();
  if (type == "disconnect") {
    out->type = FeedEventType::kDisconnect;
    return true;
  }
  if (type != "connect") {
    return Fail(out, "unknown record type '" + type + "'");
  }
  auto& block = out->block;
  block.height = out->height;
  block.hash = out->hash;
  if (!ReadHash(doc, "prev", &block.previous_block_hash)) {
    return Fail(out, "block has no valid parent hash");
  }
  if (!doc.contains("txs") || !doc.at("txs").is_array() || doc.at("txs").empty()) {
    return Fail(out, "block has no transactions");
  }
  const auto& txs = doc.at("txs");
  block.transactions.resize(txs.size());
  for (std::size_t i = 0; i < txs.size(); ++i) {
    std::string error;
    if (!ParseTransaction(txs[i], &block.transactions[i], &error)) {
      return Fail(out, "block " + std::to_string(out->height) + " tx " + std::to_string(i) +
                           ": " + error);
    }
  }
  out->type = FeedEventType::kConnect;
  return true;
}

std::string EncodeFeedEvent(const FeedEvent& event) {
  nlohmann::json doc;
  doc["height"] = event.height;
  doc["hash"] = primitives::HashToDisplayHex(event.hash);
  if (event.type == FeedEventType::kDisconnect) {
    doc["type"] = "disconnect";
    return doc.dump();
  }
  doc["type"] = "connect";
  doc["prev"] = primitives::HashToDisplayHex(event.block.previous_block_hash);
  nlohmann::json txs = nlohmann::json::array();
  for (const auto& tx : event.block.transactions) {
    std::vector<std::uint8_t> raw;
    primitives::serialize::SerializeTransaction(tx, &raw);
    nlohmann::json item;
    item["hex"] = util::HexEncode(raw);
    nlohmann::json prevouts = nlohmann::json::array();
    if (!tx.IsCoinbase()) {
      for (const auto& in : tx.vin) {
        prevouts.push_back(util::HexEncode(in.prevout_script_pubkey));
      }
    }
    item["prevouts"] = std::move(prevouts);
    txs.push_back(std::move(item));
  }
  doc["txs"] = std::move(txs);
  return doc.dump();
}

BlockFeed::BlockFeed(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

bool BlockFeed::Push(FeedEvent event, std::stop_token stop) {
  DisconnectObserver observer;
  std::optional<FeedEvent> notify;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!space_cv_.wait(lock, stop, [this] { return queue_.size() < capacity_; })) {
      return false;
    }
    if (event.type == FeedEventType::kDisconnect && observer_) {
      observer = observer_;
      notify = event;
    }
    queue_.push_back(std::move(event));
  }
  cv_.notify_all();
  if (observer) {
    observer(*notify);
  }
  return true;
}

FeedWaitResult BlockFeed::WaitNext(std::stop_token stop, std::chrono::milliseconds timeout,
                                   FeedEvent* out) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready =
      cv_.wait_for(lock, stop, timeout, [this] { return !queue_.empty() || closed_; });
  if (!queue_.empty()) {
    *out = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    space_cv_.notify_all();
    return FeedWaitResult::kEvent;
  }
  if (stop.stop_requested()) {
    return FeedWaitResult::kStopped;
  }
  if (ready && closed_) {
    return FeedWaitResult::kClosed;
  }
  return FeedWaitResult::kTimeout;
}

void BlockFeed::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool BlockFeed::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t BlockFeed::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void BlockFeed::SetDisconnectObserver(DisconnectObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

namespace {

// False once the reader is asked to stop while the feed is full.
bool PushLine(std::string line, BlockFeed* feed, std::uint64_t line_number,
              std::stop_token stop) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); })) {
    return true;
  }
  FeedEvent event;
  if (!ParseFeedLine(line, &event)) {
    util::LogError("feed", "line " + std::to_string(line_number) + ": " + event.error);
  }
  return feed->Push(std::move(event), stop);
}

}  // namespace

void RunFeedReader(int fd, BlockFeed* feed, std::stop_token stop) {
#ifdef _WIN32
  (void)fd;
  (void)stop;
  util::LogError("feed", "feed reader is not supported on this platform");
#else
  std::string pending;
  std::vector<char> buffer(kReadChunk);
  std::uint64_t line_number = 0;
  while (!stop.stop_requested()) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      util::LogError("feed", std::string("poll failed: ") + std::strerror(errno));
      break;
    }
    if (rc == 0) {
      continue;
    }
    const auto n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      util::LogError("feed", std::string("read failed: ") + std::strerror(errno));
      break;
    }
    if (n == 0) {
      if (!pending.empty()) {
        PushLine(std::move(pending), feed, ++line_number, stop);
        pending.clear();
      }
      util::LogInfo("feed", "end of block feed after " + std::to_string(line_number) + " lines");
      break;
    }
    pending.append(buffer.data(), static_cast<std::size_t>(n));
    std::size_t start = 0;
    bool stopped = false;
    for (auto pos = pending.find('\n'); pos != std::string::npos;
         pos = pending.find('\n', start)) {
      if (!PushLine(pending.substr(start, pos - start), feed, ++line_number, stop)) {
        stopped = true;
        break;
      }
      start = pos + 1;
    }
    if (stopped) {
      break;
    }
    pending.erase(0, start);
  }
#endif
  feed->Close();
}

}  // namespace sps::node
