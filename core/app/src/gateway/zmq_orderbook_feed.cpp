#include "autotrade/gateway/zmq_orderbook_feed.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace autotrade {

namespace {

std::vector<domain::PriceLevel> parseLevels(const nlohmann::json& levels) {
  std::vector<domain::PriceLevel> out;
  out.reserve(levels.size());
  for (const auto& level : levels) {
    domain::PriceLevel pl;
    pl.price = level.at(0).get<double>();
    pl.quantity = level.at(1).get<double>();
    out.push_back(pl);
  }
  return out;
}

}  // namespace

ZmqOrderbookFeed::ZmqOrderbookFeed(std::string endpoint,
                                   SimulationTimeProvider* sim_clock)
    : endpoint_(std::move(endpoint)), sim_clock_(sim_clock) {}

ZmqOrderbookFeed::~ZmqOrderbookFeed() { stop(); }

// -----------------------------------------------------------------------------
// start(): SUB socket with receive timeout, then the recv thread
// -----------------------------------------------------------------------------
void ZmqOrderbookFeed::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);

  // Accept every topic; symbol routing happens on the parsed payload.
  socket_->set(zmq::sockopt::subscribe, "");
  // Bounded recv so the loop re-checks running_ during shutdown.
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ZmqOrderbookFeed] listening on " << endpoint_ << "\n";
}

void ZmqOrderbookFeed::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  socket_.reset();
  context_.reset();

  std::cout << "[ZmqOrderbookFeed] recv loop exited.\n";
}

// -----------------------------------------------------------------------------
// run(): recv loop
// -----------------------------------------------------------------------------
void ZmqOrderbookFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[ZmqOrderbookFeed] recv failed: " << e.what() << "\n";
      continue;
    }

    if (!result.has_value()) {
      continue;  // timeout
    }

    std::string payload = msg.to_string();
    try {
      onSnapshot(parseSnapshot(payload));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[ZmqOrderbookFeed] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// parseSnapshot()
// -----------------------------------------------------------------------------
domain::Orderbook ZmqOrderbookFeed::parseSnapshot(const std::string& payload) {
  auto json = nlohmann::json::parse(payload);

  domain::Orderbook book;
  book.symbol = json.at("symbol").get<std::string>();
  book.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
  book.bids = parseLevels(json.at("bids"));
  book.asks = parseLevels(json.at("asks"));

  std::sort(book.bids.begin(), book.bids.end(),
            [](const auto& a, const auto& b) { return a.price > b.price; });
  std::sort(book.asks.begin(), book.asks.end(),
            [](const auto& a, const auto& b) { return a.price < b.price; });
  return book;
}

// -----------------------------------------------------------------------------
// onSnapshot(): clock → cache → subscribers
// -----------------------------------------------------------------------------
void ZmqOrderbookFeed::onSnapshot(domain::Orderbook book) {
  if (sim_clock_ != nullptr) {
    sim_clock_->advance_time(book.timestamp_ms);
  }

  {
    std::lock_guard lock(books_mutex_);
    books_[book.symbol] = book;
  }

  std::lock_guard lock(subscribers_mutex_);
  for (const auto& [id, entry] : subscribers_) {
    if (entry.first == book.symbol) {
      entry.second(book);
    }
  }
}

domain::Orderbook ZmqOrderbookFeed::getOrderbook(const std::string& symbol,
                                                 std::size_t depth) {
  domain::Orderbook book;
  {
    std::lock_guard lock(books_mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) {
      throw std::runtime_error("No orderbook snapshot received for " + symbol);
    }
    book = it->second;
  }

  if (book.bids.size() > depth) {
    book.bids.resize(depth);
  }
  if (book.asks.size() > depth) {
    book.asks.resize(depth);
  }
  return book;
}

IOrderbookFeed::SubscriptionId ZmqOrderbookFeed::subscribeOrderbook(
    const std::string& symbol, Callback callback) {
  std::lock_guard lock(subscribers_mutex_);
  const SubscriptionId id = next_subscription_++;
  subscribers_.emplace(id, std::make_pair(symbol, std::move(callback)));
  return id;
}

void ZmqOrderbookFeed::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(subscribers_mutex_);
  subscribers_.erase(id);
}

}  // namespace autotrade
