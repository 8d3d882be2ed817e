/*
 * 설명: 빠른 대전 FIFO 대기열과 초대/AI 게임 생성을 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_queue_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "arena/connection_registry.hpp"
#include "arena/game_manager.hpp"
#include "arena/observability.hpp"
#include "arena/profile_directory.hpp"

namespace arena {

struct EnqueueOutcome {
  std::optional<int> game_id;  // 즉시 매칭되었을 때만 설정
  std::size_t queue_length{0};
};

class MatchQueueService : public std::enable_shared_from_this<MatchQueueService> {
 public:
  MatchQueueService(std::shared_ptr<GameManager> game_manager, std::shared_ptr<ConnectionRegistry> registry,
                    std::shared_ptr<ProfileDirectory> profiles, std::shared_ptr<Observability> observability);

  bool Enqueue(int user_id, EnqueueOutcome& outcome, std::string& error_code, std::string& error_message);
  // 대기열에 없으면 아무 것도 하지 않고 false 를 반환한다.
  bool Cancel(int user_id);
  bool CreatePrivate(int user_id, int& game_id, std::string& error_code, std::string& error_message);
  bool CreateAi(int user_id, const std::string& difficulty, int& game_id, AiDifficulty& resolved,
                std::string& error_code, std::string& error_message);
  bool JoinPrivate(int user_id, int game_id, std::string& error_code, std::string& error_message);
  // 호출자의 대기 중인 초대 게임을 재사용하거나 새로 만든다. 상대가 접속 중일 때만 알림을 보낸다.
  bool SendInvitation(int from_user_id, int to_user_id, int& game_id, bool& delivered, std::string& error_code,
                      std::string& error_message);

  void HandleDisconnect(int user_id) { Cancel(user_id); }
  bool IsQueued(int user_id);
  std::size_t QueueLength();

 private:
  struct QueueEntry {
    int user_id;
    std::chrono::steady_clock::time_point joined_at;
  };

  void DropStaleLocked();
  void RemoveLocked(int user_id);

  std::shared_ptr<GameManager> game_manager_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ProfileDirectory> profiles_;
  std::shared_ptr<Observability> observability_;
  std::list<QueueEntry> queue_;
  std::unordered_map<int, std::list<QueueEntry>::iterator> user_index_;
  std::mutex mutex_;
};

}  // namespace arena
