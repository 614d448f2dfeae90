#pragma once

#include "inference/inference_types.h"

#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace infergate {

// In-memory conversation with one model. Never persisted.
struct ChatSession {
  std::string id; // 8 hex characters
  std::string model_id;
  std::string system_prompt;
  std::vector<ChatMessage> messages; // system prompt first, when set
  std::string created_at;
  std::string last_activity;
};

void to_json(nlohmann::json &j, const ChatSession &session);

// Thread-safe session table. Accessors return copies.
class ChatSessionStore {
public:
  ChatSessionStore();

  ChatSession Create(const std::string &model_id,
                     const std::string &system_prompt = "");
  std::optional<ChatSession> Get(const std::string &id) const;
  // Ordered by creation time.
  std::vector<ChatSession> List() const;
  bool Delete(const std::string &id);

  // Appends `message`, stamping it when it has no timestamp. Returns the
  // transcript after the append, or nullopt when the session is gone.
  std::optional<std::vector<ChatMessage>> Append(const std::string &id,
                                                 ChatMessage message);

private:
  std::string NewIdLocked();

  mutable std::mutex mutex_;
  std::map<std::string, ChatSession> sessions_;
  std::vector<std::string> order_;
  std::mt19937 rng_;
};

} // namespace infergate
