/*
 * 설명: 서버 전체 수명주기(저장소 준비, 백그라운드 루프, HTTP 리스너, 종료)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/icc_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "icc/applause.hpp"
#include "icc/auth.hpp"
#include "icc/backend.hpp"
#include "icc/cancel_signal.hpp"
#include "icc/config.hpp"
#include "icc/gateway.hpp"
#include "icc/notify.hpp"
#include "icc/observability.hpp"
#include "icc/settings.hpp"

namespace icc {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 저장소가 준비될 때까지 기다린 뒤 요청을 처리한다. Stop() 또는 SIGINT/SIGTERM 까지 블로킹.
  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Backend> GetBackend() { return backend_; }
  std::shared_ptr<NotifyService> GetNotifyService() { return notify_; }
  std::shared_ptr<ApplauseService> GetApplauseService() { return applause_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void StartBackground();
  void WaitInFlight();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<CancelSignal> shutdown_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<Backend> backend_;
  std::shared_ptr<SettingsSource> settings_;
  std::shared_ptr<Authenticator> authenticator_;
  std::shared_ptr<NotifyService> notify_;
  std::shared_ptr<ApplauseService> applause_;
  std::shared_ptr<Router> router_;
  std::vector<std::thread> workers_;
  std::vector<std::thread> background_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
};

}  // namespace icc
