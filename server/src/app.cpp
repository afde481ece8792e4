/*
 * 설명: 서버 수명주기, 리스닝 소켓, 환경설정 로딩을 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#include "chatrelay/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chatrelay/chat_directory.hpp"
#include "chatrelay/connection_registry.hpp"
#include "chatrelay/dispatcher.hpp"
#include "chatrelay/fanout_bridge.hpp"
#include "chatrelay/http_session.hpp"
#include "chatrelay/message_store.hpp"
#include "chatrelay/subscription_index.hpp"

namespace chatrelay {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           RealtimeServices services, std::shared_ptr<PresenceTracker> presence)
      : ioc_(ioc),
        acceptor_(boost::asio::make_strand(ioc)),
        config_(config),
        services_(std::move(services)),
        presence_(std::move(presence)) {
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
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->services_, self->presence_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  RealtimeServices services_;
  std::shared_ptr<PresenceTracker> presence_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<PubSubTransport> transport)
    : config_(config),
      ioc_(static_cast<int>(std::max<std::size_t>(1, config.worker_threads))),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_, SIGINT, SIGTERM),
      transport_(std::move(transport)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  if (config.directory_mode == "mariadb" || config.persistence_mode == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
  }

  services_.observability = observability_;
  services_.token_verifier = std::make_shared<TokenVerifier>(config.jwt_secret);
  if (config.directory_mode == "mariadb") {
    services_.directory = std::make_shared<MariaDbChatDirectory>(db_client_);
  } else {
    services_.directory = std::make_shared<OpenChatDirectory>();
  }

  services_.subscriptions = std::make_shared<SubscriptionIndex>();
  services_.registry =
      std::make_shared<ConnectionRegistry>(services_.subscriptions, config.ws_max_connections_per_user);
  services_.registry->SetObservability(observability_);
  services_.dispatcher = std::make_shared<Dispatcher>(services_.registry, services_.subscriptions, observability_);
  presence_ = std::make_shared<PresenceTracker>(services_.registry, services_.subscriptions, services_.dispatcher);
  services_.registry->SetPresenceListener(presence_);

  std::shared_ptr<MessageStore> store;
  if (config.persistence_mode == "mariadb") {
    store = std::make_shared<MariaDbMessageStore>(db_client_);
  } else {
    store = std::make_shared<LoggingMessageStore>(observability_);
  }
  services_.message_writer = std::make_shared<AsyncMessageWriter>(store, observability_, config.persist_workers);
  services_.message_ids = std::make_shared<MessageIdGenerator>(config.server_id);

  if (!transport_ && config.fanout_mode == "redis") {
    RedisSettings settings;
    settings.host = config.redis_host;
    settings.port = config.redis_port;
    settings.password = config.redis_password;
    transport_ = std::make_shared<RedisPubSubTransport>(settings, observability_);
  }
  if (transport_) {
    services_.bridge = std::make_shared<FanoutBridge>(config.server_id, config.redis_channel_prefix, transport_,
                                                      services_.dispatcher, observability_);
  }

  reaper_ = std::make_shared<IdleReaper>(ioc_, services_.registry, observability_,
                                         std::chrono::seconds(config.ws_idle_timeout_seconds),
                                         std::chrono::seconds(config.ws_reap_interval_seconds));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, services_, presence_);
    listener_->Run();
    if (services_.bridge) {
      services_.bridge->Start();
    }
    reaper_->Start();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Info("signal_received", {{"signal", signal_number}});
      Halt();
    });
    observability_->Info("server_started", {{"port", config_.port},
                                            {"serverId", config_.server_id},
                                            {"fanout", services_.bridge ? "pubsub" : "local"},
                                            {"directory", config_.directory_mode}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Error("server_run_failed", {{"reason", ex.what()}});
  }
  Stop();
}

void ServerApp::RunWorkers() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  const std::size_t thread_count = std::max<std::size_t>(1, config_.worker_threads);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Halt() {
  if (halted_.exchange(true)) {
    return;
  }
  running_ = false;
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  if (reaper_) {
    reaper_->Stop();
  }
  if (services_.bridge) {
    services_.bridge->Stop();
  }
  if (listener_) {
    listener_->Stop();
  }
  work_guard_.reset();
  ioc_.stop();
}

void ServerApp::Stop() {
  Halt();
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
      if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
      }
    }
  }
  if (services_.message_writer) {
    services_.message_writer->Shutdown();
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8000")));
  cfg.server_id = get_env("SERVER_ID", "chatrelay-1");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "chat_db");
  cfg.redis_host = get_env("REDIS_HOST", "redis");
  cfg.redis_port = static_cast<unsigned short>(std::stoi(get_env("REDIS_PORT", "6379")));
  cfg.redis_password = get_env("REDIS_PASSWORD", "");
  cfg.redis_channel_prefix = get_env("REDIS_CHANNEL_PREFIX", "");
  cfg.fanout_mode = get_env("FANOUT_MODE", "redis");
  cfg.directory_mode = get_env("DIRECTORY_MODE", "mariadb");
  cfg.persistence_mode = get_env("PERSISTENCE_MODE", "mariadb");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret = get_env("JWT_SECRET_KEY", "change-me");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "256");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "1048576");
  cfg.ws_write_timeout_seconds = get_size("WS_WRITE_TIMEOUT_SECONDS", "10");
  cfg.ws_idle_timeout_seconds = get_size("WS_IDLE_TIMEOUT_SECONDS", "1800");
  cfg.ws_reap_interval_seconds = get_size("WS_REAP_INTERVAL_SECONDS", "60");
  cfg.ws_max_connections_per_user = get_size("WS_MAX_CONNECTIONS_PER_USER", "5");
  cfg.persist_workers = get_size("PERSIST_WORKERS", "2");
  cfg.worker_threads = get_size("WORKER_THREADS", std::to_string(std::max(1u, std::thread::hardware_concurrency())).c_str());
  return cfg;
}

}  // namespace chatrelay
