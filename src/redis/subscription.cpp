#include "redis/subscription.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace redis {

RedisSubscription::RedisSubscription(const Endpoint& endpoint,
                                     std::chrono::milliseconds connect_timeout,
                                     std::chrono::milliseconds command_timeout)
  : connection_(std::make_unique<Connection>())
  , command_timeout_(command_timeout) {
  connection_->connect(endpoint, connect_timeout);
  BOOST_LOG_TRIVIAL(debug) << "Subscription: Opened notification channel on " << endpoint.to_string();
}

RedisSubscription::~RedisSubscription() {
  close();
}

void RedisSubscription::psubscribe(const std::string& pattern) {
  send_and_confirm({"PSUBSCRIBE", pattern}, "psubscribe");
  patterns_.push_back(pattern);
  BOOST_LOG_TRIVIAL(debug) << "Subscription: Subscribed to pattern " << pattern;
}

void RedisSubscription::punsubscribe(const std::string& pattern) {
  send_and_confirm({"PUNSUBSCRIBE", pattern}, "punsubscribe");
  patterns_.erase(std::remove(patterns_.begin(), patterns_.end(), pattern), patterns_.end());
  BOOST_LOG_TRIVIAL(debug) << "Subscription: Unsubscribed from pattern " << pattern;
}

void RedisSubscription::close() {
  if (connection_ && connection_->is_connected()) {
    connection_->close();
    BOOST_LOG_TRIVIAL(debug) << "Subscription: Notification channel closed";
  }
  patterns_.clear();
  pending_.clear();
}

std::optional<PubSubMessage> RedisSubscription::get_message(std::chrono::milliseconds timeout) {
  if (!pending_.empty()) {
    PubSubMessage message = std::move(pending_.front());
    pending_.pop_front();
    return message;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return std::nullopt;
    }

    std::optional<Reply> reply = connection_->read_reply(remaining);
    if (!reply) {
      return std::nullopt;
    }
    if (auto message = to_message(*reply)) {
      return message;
    }
    // Late (un)subscribe confirmations carry no data
  }
}

void RedisSubscription::send_and_confirm(const Command& command, const std::string& confirmation) {
  connection_->send(command, command_timeout_);

  const auto deadline = std::chrono::steady_clock::now() + command_timeout_;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    std::optional<Reply> reply;
    if (remaining.count() > 0) {
      reply = connection_->read_reply(remaining);
    }
    if (!reply) {
      connection_->close();
      throw db::ConnectionError("No " + confirmation + " confirmation received");
    }

    if (reply->is_error()) {
      throw db::SchemaError(command.front() + ": " + reply->str);
    }
    if (reply->is_array() && !reply->elements.empty() &&
        reply->elements.front().str == confirmation) {
      return;
    }
    if (auto message = to_message(*reply)) {
      pending_.push_back(std::move(*message));
    }
  }
}

std::optional<PubSubMessage> RedisSubscription::to_message(const Reply& reply) {
  if (!reply.is_array() || reply.elements.empty()) {
    return std::nullopt;
  }

  const auto& items = reply.elements;
  if (items[0].str == "pmessage" && items.size() == 4) {
    return PubSubMessage{items[1].str, items[2].str, items[3].str};
  }
  if (items[0].str == "message" && items.size() == 3) {
    return PubSubMessage{"", items[1].str, items[2].str};
  }
  return std::nullopt;
}

} // namespace redis
} // namespace cfgdb
