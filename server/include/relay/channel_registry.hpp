/*
 * 설명: 채널 ID별 참여 연결 목록을 보관하는 프로세스 단위 레지스트리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/connection.hpp"

namespace relay {

using ConnectionPtr = std::shared_ptr<Connection>;

// 내부 동기화가 없다. 호출자는 RelayService의 잠금 안에서만 접근한다.
class ChannelRegistry {
 public:
  void Join(const ConnectionPtr& connection);
  // 연결을 채널 멤버에서 뺀다. 빈 채널 자체는 리퍼가 정리할 때까지 남는다.
  bool Remove(const Connection* connection);

  bool Contains(const std::string& channel_id) const;
  // 브로드캐스트 중 멤버가 바뀌어도 안전하도록 복사본을 돌려준다.
  std::vector<ConnectionPtr> Members(const std::string& channel_id) const;
  std::vector<ConnectionPtr> AllConnections() const;
  std::vector<std::string> ChannelIds() const;

  bool HasOpenHost(const std::string& channel_id) const;
  std::size_t LiveMemberCount(const std::string& channel_id) const;
  void EraseChannel(const std::string& channel_id);

  std::size_t ChannelCount() const { return channels_.size(); }
  std::size_t ConnectionCount() const;

 private:
  struct Channel {
    std::vector<ConnectionPtr> members;
  };

  std::unordered_map<std::string, Channel> channels_;
};

}  // namespace relay
