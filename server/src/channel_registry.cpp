/*
 * 설명: 채널 생성/멤버 추가/제거와 스냅샷 조회를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#include "relay/channel_registry.hpp"

#include <algorithm>

namespace relay {

void ChannelRegistry::Join(const ConnectionPtr& connection) {
  channels_[connection->ChannelId()].members.push_back(connection);
}

bool ChannelRegistry::Remove(const Connection* connection) {
  auto it = channels_.find(connection->ChannelId());
  if (it == channels_.end()) {
    return false;
  }
  auto& members = it->second.members;
  auto member_it = std::find_if(members.begin(), members.end(),
                                [connection](const ConnectionPtr& member) { return member.get() == connection; });
  if (member_it == members.end()) {
    return false;
  }
  members.erase(member_it);
  return true;
}

bool ChannelRegistry::Contains(const std::string& channel_id) const { return channels_.count(channel_id) > 0; }

std::vector<ConnectionPtr> ChannelRegistry::Members(const std::string& channel_id) const {
  auto it = channels_.find(channel_id);
  if (it == channels_.end()) {
    return {};
  }
  return it->second.members;
}

std::vector<ConnectionPtr> ChannelRegistry::AllConnections() const {
  std::vector<ConnectionPtr> all;
  for (const auto& [id, channel] : channels_) {
    all.insert(all.end(), channel.members.begin(), channel.members.end());
  }
  return all;
}

std::vector<std::string> ChannelRegistry::ChannelIds() const {
  std::vector<std::string> ids;
  ids.reserve(channels_.size());
  for (const auto& [id, channel] : channels_) {
    ids.push_back(id);
  }
  return ids;
}

bool ChannelRegistry::HasOpenHost(const std::string& channel_id) const {
  auto it = channels_.find(channel_id);
  if (it == channels_.end()) {
    return false;
  }
  const auto& members = it->second.members;
  return std::any_of(members.begin(), members.end(),
                     [](const ConnectionPtr& member) { return member->IsHost() && member->IsOpen(); });
}

std::size_t ChannelRegistry::LiveMemberCount(const std::string& channel_id) const {
  auto it = channels_.find(channel_id);
  if (it == channels_.end()) {
    return 0;
  }
  const auto& members = it->second.members;
  return static_cast<std::size_t>(std::count_if(
      members.begin(), members.end(), [](const ConnectionPtr& member) { return member->IsOpenOrConnecting(); }));
}

void ChannelRegistry::EraseChannel(const std::string& channel_id) { channels_.erase(channel_id); }

std::size_t ChannelRegistry::ConnectionCount() const {
  std::size_t total = 0;
  for (const auto& [id, channel] : channels_) {
    total += channel.members.size();
  }
  return total;
}

}  // namespace relay
