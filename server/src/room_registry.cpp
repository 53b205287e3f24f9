/*
 * 설명: 룸 코드 정규화와 룸 컨텍스트 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#include "thumbwar/room_registry.hpp"

#include <cctype>

namespace thumbwar {

RoomRegistry::RoomRegistry(boost::asio::io_context& ioc, const ArenaConfig& defaults)
    : ioc_(ioc), defaults_(defaults) {}

std::string RoomRegistry::NormalizeCode(std::string_view raw) {
  std::size_t begin = 0;
  std::size_t end = raw.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) {
    --end;
  }
  std::string code;
  code.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(raw[i]))));
  }
  return code;
}

bool RoomRegistry::IsValidCode(const std::string& normalized) {
  return !normalized.empty() && normalized.size() <= kMaxRoomCodeLength;
}

std::shared_ptr<RoomContext> RoomRegistry::GetOrCreate(const std::string& code, bool& created) {
  std::lock_guard<std::mutex> lock(mutex_);
  created = false;
  auto it = rooms_.find(code);
  if (it != rooms_.end()) {
    return it->second;
  }
  auto ctx = std::make_shared<RoomContext>(ioc_, code, defaults_);
  rooms_.emplace(code, ctx);
  created = true;
  return ctx;
}

std::shared_ptr<RoomContext> RoomRegistry::Find(const std::string& code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(code);
  if (it == rooms_.end()) {
    return nullptr;
  }
  return it->second;
}

bool RoomRegistry::Remove(const std::string& code, const RoomContext* expected) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(code);
  if (it == rooms_.end() || it->second.get() != expected) {
    return false;
  }
  rooms_.erase(it);
  return true;
}

std::size_t RoomRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.size();
}

std::vector<std::shared_ptr<RoomContext>> RoomRegistry::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<RoomContext>> result;
  result.reserve(rooms_.size());
  for (const auto& entry : rooms_) {
    result.push_back(entry.second);
  }
  return result;
}

}  // namespace thumbwar
