/*
 * 설명: 서버 수명주기와 리스닝 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "thumbwar/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "thumbwar/http_session.hpp"

namespace thumbwar {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<SessionManager> session_manager,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        session_manager_(std::move(session_manager)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  // 워커가 모두 멈춘 뒤에 호출한다.
  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_,
                                          self->session_manager_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(config.log_level);
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  registry_ = std::make_shared<RoomRegistry>(ioc_, config.arena);
  session_manager_ = std::make_shared<SessionManager>(registry_, coordinator_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, session_manager_, observability_);
  listener_->Run();
  bound_port_ = listener_->Port();
  observability_->Event(LogLevel::kInfo, "server.started", std::nullopt, std::nullopt,
                        "port " + std::to_string(bound_port_));
  RunWorkers();
}

void ServerApp::Run() {
  Start();
  signals_.emplace(ioc_, SIGINT, SIGTERM);
  signals_->async_wait([this](const boost::system::error_code& ec, int /*signal*/) {
    if (!ec) {
      observability_->Event(LogLevel::kInfo, "server.signal");
      ioc_.stop();
    }
  });
  ioc_.run();
  Stop();
}

void ServerApp::RunWorkers() {
  unsigned int thread_count = config_.worker_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  if (listener_) {
    listener_->Stop();
  }
  observability_->Event(LogLevel::kInfo, "server.stopped");
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  auto level = ParseLogLevel(get_env("LOG_LEVEL", "info"));
  if (!level) {
    throw std::invalid_argument("LOG_LEVEL must be one of debug, info, warn, error");
  }
  cfg.log_level = *level;
  cfg.arena.width = std::stod(get_env("ARENA_WIDTH", "800"));
  cfg.arena.height = std::stod(get_env("ARENA_HEIGHT", "500"));
  cfg.arena.radius = std::stod(get_env("TOKEN_RADIUS", "30"));
  cfg.arena.win_pin_seconds = std::stod(get_env("WIN_PIN_SECONDS", "2.0"));
  cfg.arena.move_speed = std::stod(get_env("MOVE_SPEED", "3.2"));
  cfg.arena.tick_rate_hz = std::stoi(get_env("TICK_RATE_HZ", "60"));
  const long long queue_messages = std::stoll(get_env("WS_QUEUE_LIMIT_MESSAGES", "64"));
  const long long queue_bytes = std::stoll(get_env("WS_QUEUE_LIMIT_BYTES", "262144"));
  if (queue_messages <= 0 || queue_bytes <= 0) {
    throw std::invalid_argument("WS_QUEUE_LIMIT_* must be positive");
  }
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(queue_messages);
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(queue_bytes);
  constexpr long kMaxWorkerThreads = 256;
  const long workers = std::stol(get_env("WORKER_THREADS", "0"));
  if (workers < 0 || workers > kMaxWorkerThreads) {
    throw std::invalid_argument("WORKER_THREADS must be between 0 and 256");
  }
  cfg.worker_threads = static_cast<unsigned int>(workers);
  const int port = std::stoi(get_env("SERVER_PORT", "3000"));
  if (port < 0 || port > 65535) {
    throw std::invalid_argument("SERVER_PORT must be between 0 and 65535");
  }
  cfg.port = static_cast<unsigned short>(port);

  if (cfg.arena.tick_rate_hz <= 0) {
    throw std::invalid_argument("TICK_RATE_HZ must be positive");
  }
  if (cfg.arena.radius <= 0.0 || cfg.arena.width < 2 * cfg.arena.radius || cfg.arena.height < 2 * cfg.arena.radius) {
    throw std::invalid_argument("arena must be at least one token diameter on each axis");
  }
  if (cfg.arena.win_pin_seconds <= 0.0) {
    throw std::invalid_argument("WIN_PIN_SECONDS must be positive");
  }
  return cfg;
}

}  // namespace thumbwar
