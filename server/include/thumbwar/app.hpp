/*
 * 설명: 서버 전체 수명주기(리스너, 워커 스레드, 서비스 연결)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "thumbwar/config.hpp"
#include "thumbwar/observability.hpp"
#include "thumbwar/realtime.hpp"
#include "thumbwar/room_registry.hpp"
#include "thumbwar/session_manager.hpp"

namespace thumbwar {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // Start는 리스너와 워커 스레드를 띄우고 즉시 반환한다. Run은 시그널을 받을 때까지 블록한다.
  void Start();
  void Run();
  void Stop();

  unsigned short Port() const { return bound_port_; }
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
  std::shared_ptr<RoomRegistry> GetRoomRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<SessionManager> session_manager_;
  std::optional<boost::asio::signal_set> signals_;
  std::vector<std::thread> workers_;
  unsigned short bound_port_{0};
  std::atomic<bool> running_{false};
};

}  // namespace thumbwar
