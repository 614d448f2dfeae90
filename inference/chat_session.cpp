#include "inference/chat_session.h"

#include "util/time_format.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>

using json = nlohmann::json;

namespace infergate {

void to_json(json &j, const ChatSession &session) {
  j = json{{"id", session.id},
           {"model_id", session.model_id},
           {"messages", session.messages},
           {"created_at", session.created_at},
           {"last_activity", session.last_activity}};
  if (session.system_prompt.empty()) {
    j["system_prompt"] = nullptr;
  } else {
    j["system_prompt"] = session.system_prompt;
  }
}

ChatSessionStore::ChatSessionStore() : rng_(std::random_device{}()) {}

std::string ChatSessionStore::NewIdLocked() {
  std::uniform_int_distribution<uint32_t> dist;
  char buffer[9];
  do {
    std::snprintf(buffer, sizeof(buffer), "%08x",
                  static_cast<unsigned>(dist(rng_)));
  } while (sessions_.count(buffer) > 0);
  return buffer;
}

ChatSession ChatSessionStore::Create(const std::string &model_id,
                                     const std::string &system_prompt) {
  ChatSession session;
  session.model_id = model_id;
  session.system_prompt = system_prompt;
  session.created_at = IsoTimestampNow();
  session.last_activity = session.created_at;
  if (!system_prompt.empty()) {
    session.messages.push_back({"system", system_prompt, session.created_at});
  }
  std::lock_guard<std::mutex> lock(mutex_);
  session.id = NewIdLocked();
  sessions_[session.id] = session;
  order_.push_back(session.id);
  return session;
}

std::optional<ChatSession>
ChatSessionStore::Get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ChatSession> ChatSessionStore::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChatSession> out;
  out.reserve(order_.size());
  for (const auto &id : order_) {
    out.push_back(sessions_.at(id));
  }
  return out;
}

bool ChatSessionStore::Delete(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.erase(id) == 0) {
    return false;
  }
  order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
  return true;
}

std::optional<std::vector<ChatMessage>>
ChatSessionStore::Append(const std::string &id, ChatMessage message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  if (message.timestamp.empty()) {
    message.timestamp = IsoTimestampNow();
  }
  it->second.last_activity = message.timestamp;
  it->second.messages.push_back(std::move(message));
  return it->second.messages;
}

} // namespace infergate
