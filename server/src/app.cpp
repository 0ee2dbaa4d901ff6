/*
 * 설명: 서버 수명주기, 리스닝, 백그라운드 루프, 환경설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/icc_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "icc/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "icc/db_client.hpp"
#include "icc/http_session.hpp"
#include "icc/memory_backend.hpp"
#include "icc/redis_backend.hpp"

namespace icc {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router, std::shared_ptr<CancelSignal> shutdown,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), router_(std::move(router)),
        shutdown_(std::move(shutdown)), observability_(std::move(observability)) {
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

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->router_, self->shutdown_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<CancelSignal> shutdown_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM),
      shutdown_(std::make_shared<CancelSignal>()) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  if (config.backend == BackendKind::kMemory) {
    backend_ = std::make_shared<MemoryBackend>();
  } else {
    RedisConfig redis_config;
    redis_config.host = config.redis_host;
    redis_config.port = config.redis_port;
    backend_ = std::make_shared<RedisBackend>(redis_config);
  }

  if (config.settings == SettingsMode::kMariaDb) {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    settings_ = std::make_shared<MariaDbSettingsSource>(std::make_shared<MariaDbClient>(db_config));
  } else {
    settings_ = std::make_shared<StaticSettingsSource>(
        std::chrono::seconds(static_cast<std::int64_t>(config.applause_interval_seconds)));
  }

  if (config.auth == AuthMode::kTicket) {
    authenticator_ = std::make_shared<TokenAuthenticator>(config.auth_token_key);
  } else {
    authenticator_ = std::make_shared<FakeAuthenticator>(1);
  }
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  running_ = true;
  try {
    // 저장소가 응답할 때까지 리스너를 열지 않는다.
    if (!WaitForReady(*backend_, *shutdown_, observability_)) {
      Stop();
      return;
    }
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      if (shutdown_->IsCancelled()) {
        return;
      }
      notify_ = std::make_shared<NotifyService>(backend_);

      ApplauseConfig applause_config;
      applause_config.retention = std::chrono::seconds(static_cast<std::int64_t>(config_.applause_retention_seconds));
      applause_config.tick = std::chrono::milliseconds(static_cast<std::int64_t>(config_.applause_tick_ms));
      applause_config.prune_tick = std::chrono::seconds(static_cast<std::int64_t>(config_.prune_tick_seconds));
      applause_config.refresh_ticks = config_.applause_refresh_ticks;
      applause_ = std::make_shared<ApplauseService>(backend_, settings_, applause_config, observability_);

      router_ = std::make_shared<Router>();
      HandleReceive(*router_, kIccReceivePath, notify_, authenticator_, observability_);
      HandleSend(*router_, kIccSendPath, notify_, authenticator_, observability_);
      HandleReceive(*router_, kApplauseReceivePath, applause_, authenticator_, observability_);
      HandleSend(*router_, kApplauseSendPath, applause_, authenticator_, observability_);
      HandleHealth(*router_, kHealthPath, observability_);

      StartBackground();

      boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
      listener_ = std::make_shared<Listener>(ioc_, endpoint, router_, shutdown_, observability_);
      listener_->Run();
      signals_.async_wait([this](const boost::system::error_code& ec, int /*signal*/) {
        if (ec) {
          return;
        }
        observability_->Info("signal", "종료 신호 수신");
        shutdown_->Cancel();
        ioc_.stop();
      });
      observability_->Info("server_start", "서버 시작: 포트 " + std::to_string(config_.port));
      RunWorkers();
    }
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Error("server_failed", std::string{"서버 실행 중 예외: "} + ex.what());
  }
  Stop();
}

void ServerApp::StartBackground() {
  background_.emplace_back([this]() { applause_->Loop(*shutdown_); });
  background_.emplace_back([this]() { applause_->PruneOldData(*shutdown_); });
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::WaitInFlight() {
  // 취소된 롱폴 핸들러가 세션으로 결과를 넘길 때까지 기다린다.
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (observability_->Snapshot().waiting > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void ServerApp::Stop() {
  shutdown_->Cancel();
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.exchange(false)) {
    return;
  }
  backend_->Close();
  WaitInFlight();
  if (listener_) {
    listener_->Stop();
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  for (auto& thread : background_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  observability_->Info("server_stop", "서버 종료");
}

namespace {
std::size_t ParseCount(const std::string& key, const std::string& value, std::size_t min_value) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(key + " 값이 숫자가 아닙니다: " + value);
  }
  if (idx != value.size() || value.front() == '-' || parsed < min_value) {
    throw std::invalid_argument(key + " 값이 올바르지 않습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}

unsigned short ParsePort(const std::string& key, const std::string& value) {
  auto parsed = ParseCount(key, value, 1);
  if (parsed > std::numeric_limits<unsigned short>::max()) {
    throw std::invalid_argument(key + " 포트 범위를 벗어났습니다: " + value);
  }
  return static_cast<unsigned short>(parsed);
}

bool ParseFlag(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  throw std::invalid_argument(key + " 값은 true/false 여야 합니다: " + value);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = ParsePort("ICC_PORT", get_env("ICC_PORT", "9007"));
  cfg.redis_host = get_env("ICC_REDIS_HOST", "localhost");
  cfg.redis_port = ParsePort("ICC_REDIS_PORT", get_env("ICC_REDIS_PORT", "6379"));

  auto backend = get_env("ICC_BACKEND", "redis");
  if (backend == "redis") {
    cfg.backend = BackendKind::kRedis;
  } else if (backend == "memory") {
    cfg.backend = BackendKind::kMemory;
  } else {
    throw std::invalid_argument("알 수 없는 ICC_BACKEND: " + backend);
  }

  cfg.applause_interval_seconds =
      ParseCount("ICC_APPLAUSE_INTERVAL_SECONDS", get_env("ICC_APPLAUSE_INTERVAL_SECONDS", "5"), 1);
  cfg.applause_retention_seconds =
      ParseCount("ICC_APPLAUSE_RETENTION_SECONDS", get_env("ICC_APPLAUSE_RETENTION_SECONDS", "300"), 1);
  // 보존 기간은 집계 창보다 짧을 수 없다.
  cfg.applause_retention_seconds = std::max(cfg.applause_retention_seconds, cfg.applause_interval_seconds);
  cfg.applause_tick_ms = ParseCount("ICC_APPLAUSE_TICK_MS", get_env("ICC_APPLAUSE_TICK_MS", "1000"), 1);
  cfg.prune_tick_seconds = ParseCount("ICC_PRUNE_TICK_SECONDS", get_env("ICC_PRUNE_TICK_SECONDS", "60"), 1);
  cfg.applause_refresh_ticks =
      ParseCount("ICC_APPLAUSE_REFRESH_TICKS", get_env("ICC_APPLAUSE_REFRESH_TICKS", "60"), 1);

  cfg.development = ParseFlag("ICC_DEVELOPMENT", get_env("ICC_DEVELOPMENT", "false"));
  auto auth = get_env("AUTH", "fake");
  if (auth == "fake") {
    cfg.auth = AuthMode::kFake;
  } else if (auth == "ticket") {
    cfg.auth = AuthMode::kTicket;
  } else {
    throw std::invalid_argument("알 수 없는 AUTH 모드: " + auth);
  }
  cfg.auth_token_key = get_env("AUTH_TOKEN_KEY", "");
  if (cfg.auth == AuthMode::kTicket && cfg.auth_token_key.empty()) {
    if (!cfg.development) {
      throw std::invalid_argument("AUTH=ticket 에는 AUTH_TOKEN_KEY 가 필요합니다");
    }
    cfg.auth_token_key = kDevelopmentTokenKey;
  }

  auto settings = get_env("ICC_SETTINGS", "static");
  if (settings == "static") {
    cfg.settings = SettingsMode::kStatic;
  } else if (settings == "mariadb") {
    cfg.settings = SettingsMode::kMariaDb;
  } else {
    throw std::invalid_argument("알 수 없는 ICC_SETTINGS: " + settings);
  }
  cfg.db_host = get_env("DB_HOST", "localhost");
  cfg.db_port = ParsePort("DB_PORT", get_env("DB_PORT", "3306"));
  cfg.db_user = get_env("DB_USER", "icc");
  cfg.db_password = get_env("DB_PASSWORD", "");
  cfg.db_name = get_env("DB_NAME", "icc");

  cfg.log_level = get_env("LOG_LEVEL", "info");
  ParseLogLevel(cfg.log_level);
  return cfg;
}

}  // namespace icc
