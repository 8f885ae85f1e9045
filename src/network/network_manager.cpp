// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/network_manager.hpp"
#include "network/message_dispatcher.hpp"
#include "network/websocket_transport.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <boost/asio/post.hpp>
#include <exception>
#include <future>
#include <optional>
#include <utility>

namespace heartsock {
namespace network {

namespace {

std::optional<std::filesystem::path> DataDirFor(const std::string &datadir) {
  if (datadir.empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(datadir);
}

} // namespace

NetworkManager::NetworkManager(
    const Config &config, std::shared_ptr<Transport> transport,
    std::shared_ptr<boost::asio::io_context> external_io_context)
    : config_(config),
      // Shared ownership of io_context ensures it outlives all async operations and timers
      io_context_(external_io_context
                      ? external_io_context
                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      values_(std::make_unique<TrackedValues>(DataDirFor(config.datadir))),
      message_dispatcher_(std::make_unique<MessageDispatcher>()),
      started_at_(util::GetSteadyTime()) {
  if (config_.send_queue_limit == 0) {
    config_.send_queue_limit = 1;
  }

  if (transport) {
    transport_ = std::move(transport);
  } else {
    WebSocketConnection::Options options;
    // Backstop for the upgrade and the close handshake; Session enforces
    // handshake_timeout itself.
    options.handshake_timeout = config_.handshake_timeout * 2;
    options.max_message_size = config_.max_message_size;
    transport_ = std::make_shared<WebSocketTransport>(*io_context_, options);
  }

  HeartbeatEngine::Config hb_config;
  hb_config.tick_interval = config_.heartbeat_interval;
  hb_config.liveness_timeout = config_.liveness_timeout;
  heartbeat_ = std::make_unique<HeartbeatEngine>(*io_context_, registry_, hb_config);

  registry_.set_empty_callback([this]() {
    IdleCallback callback;
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      callback = idle_callback_;
    }
    if (callback) {
      callback();
    }
  });

  register_handlers();
  LOG_NET_TRACE("NetworkManager initialized (external_io_context: {}, {} command handlers)",
                external_io_context_ ? "yes" : "no",
                message_dispatcher_->GetRegisteredCommands().size());
}

NetworkManager::~NetworkManager() { stop(); }

void NetworkManager::register_handlers() {
  // ping -> pong
  message_dispatcher_->RegisterHandler(
      protocol::commands::PING,
      [](const SessionPtr &session, const std::vector<std::string> &args) {
        if (!args.empty()) {
          return false;
        }
        session->send_text(protocol::replies::PONG);
        return true;
      });

  // heartbeat <seq> / pong <seq>: liveness acknowledgement, no reply
  auto acknowledge = [](const SessionPtr &session,
                        const std::vector<std::string> &args) {
    if (args.size() != 1) {
      return false;
    }
    auto seq = protocol::ParseSequence(args[0]);
    if (!seq) {
      return false;
    }
    session->note_client_sequence(*seq);
    return true;
  };
  message_dispatcher_->RegisterHandler(protocol::commands::HEARTBEAT, acknowledge);
  message_dispatcher_->RegisterHandler(protocol::commands::PONG, acknowledge);

  // get <key>
  message_dispatcher_->RegisterHandler(
      protocol::commands::GET,
      [this](const SessionPtr &session, const std::vector<std::string> &args) {
        if (args.size() != 1) {
          return false;
        }
        auto value = values_->get(args[0]);
        if (!value) {
          session->send_text(protocol::replies::UNKNOWN_KEY);
        } else {
          session->send_text(protocol::FormatValue(args[0], *value));
        }
        return true;
      });

  // set <key> <value>
  message_dispatcher_->RegisterHandler(
      protocol::commands::SET,
      [this](const SessionPtr &session, const std::vector<std::string> &args) {
        if (args.size() != 2) {
          return false;
        }
        const std::string &key = args[0];
        auto outcome = values_->set(session->id(), key, args[1]);
        switch (outcome.result) {
        case TrackedValues::SetResult::UnknownKey:
          session->send_text(protocol::replies::UNKNOWN_KEY);
          break;
        case TrackedValues::SetResult::BadValue:
          session->send_text(protocol::FormatBadValue(key));
          break;
        case TrackedValues::SetResult::TrackerConnected:
          session->send_text(protocol::replies::TRACKER_CONNECTED);
          break;
        case TrackedValues::SetResult::Ok:
          session->send_text(protocol::replies::OK);
          if (outcome.changed) {
            broadcast_except(session->id(),
                             protocol::FormatValue(key, outcome.value));
          }
          break;
        }
        return true;
      });

  // status -> one-line JSON
  message_dispatcher_->RegisterHandler(
      protocol::commands::STATUS,
      [this](const SessionPtr &session, const std::vector<std::string> &args) {
        if (!args.empty()) {
          return false;
        }
        session->send_text(status().dump());
        return true;
      });
}

bool NetworkManager::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  std::unique_lock<std::mutex> lock(start_stop_mutex_);
  stop_cv_.wait(lock, [this]() { return fully_stopped_; });
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  // Bind before any io thread exists so the acceptor is set up single-threaded
  bool listening = transport_->listen(
      config_.listen_address, config_.listen_port,
      [this](TransportConnectionPtr connection) {
        handle_inbound_connection(std::move(connection));
      });
  if (!listening) {
    LOG_NET_ERROR("Failed to start listener on {}:{}", config_.listen_address,
                  config_.listen_port);
    return false;
  }

  running_.store(true, std::memory_order_release);
  fully_stopped_ = false;
  started_at_ = util::GetSteadyTime();
  started_time_ = util::GetTime();

  if (!values_->write_all_files()) {
    LOG_NET_WARN("could not write initial value files to {}", config_.datadir);
  }

  heartbeat_->start();

  if (config_.io_threads > 0 && !external_io_context_) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  LOG_NET_INFO("WebSocket server started on {}:{}", config_.listen_address,
               transport_->listening_port());
  return true;
}

void NetworkManager::close_all_sessions() {
  transport_->stop_listening();
  heartbeat_->stop();
  auto sessions = registry_.snapshot();
  for (const auto &session : sessions) {
    session->close(CloseReason::ServerShutdown);
  }
  LOG_NET_INFO("closing {} sessions", sessions.size());
}

void NetworkManager::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::unique_lock<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  running_.store(false, std::memory_order_release);

  // 1. Stop accepting and close sessions. Runs on the io thread when we own
  //    one; otherwise the caller drives the io_context and we run inline.
  if (!io_threads_.empty()) {
    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    boost::asio::post(*io_context_, [this, done]() {
      close_all_sessions();
      done->set_value();
    });
    if (finished.wait_for(config_.shutdown_grace) != std::future_status::ready) {
      LOG_NET_WARN("network thread did not respond to shutdown in time");
    }
  } else {
    close_all_sessions();
  }

  // 2. Give transports the grace period to finish their close handshakes
  const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (io_threads_.empty()) {
      io_context_->poll();
    }
    if (transport_->open_connection_count() == 0) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  const size_t remaining = transport_->open_connection_count();
  if (remaining > 0) {
    LOG_NET_DEBUG("dropping {} connections still closing", remaining);
  }

  // 3. Stop the event loop
  if (work_guard_) {
    work_guard_.reset();
  }
  io_context_->stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Reset io_context for potential restart
  io_context_->restart();

  fully_stopped_ = true;
  stop_cv_.notify_all();
}

uint16_t NetworkManager::listening_port() const {
  return transport_->listening_port();
}

void NetworkManager::handle_inbound_connection(TransportConnectionPtr connection) {
  if (!connection) {
    return;
  }
  if (!running_.load(std::memory_order_acquire)) {
    connection->close(CloseReason::ServerShutdown);
    return;
  }

  Session::Config session_config;
  session_config.handshake_timeout = config_.handshake_timeout;
  session_config.send_queue_limit = config_.send_queue_limit;

  auto session = Session::create(*io_context_, std::move(connection),
                                 registry_.next_id(), session_config);
  session->set_open_handler(
      [this](const SessionPtr &s) { on_session_open(s); });
  session->set_message_handler(
      [this](const SessionPtr &s, const std::string &text, bool is_binary) {
        on_session_message(s, text, is_binary);
      });
  session->set_close_handler([this](const SessionPtr &s, CloseReason reason) {
    on_session_closed(s, reason);
  });

  try {
    registry_.register_session(session);
  } catch (const RegistryInvariantViolation &e) {
    LOG_NET_CRITICAL("session registry invariant violated: {}", e.what());
    std::terminate();
  }

  session->start();
}

void NetworkManager::on_session_open(const SessionPtr &session) {
  LOG_NET_INFO("Session {} connected from {}:{}", session->id(),
               session->remote_address(), session->remote_port());
  for (const auto &key : TrackedValues::Keys()) {
    auto value = values_->get(key);
    session->send_text(protocol::FormatValue(key, value.value_or(0)));
  }
}

void NetworkManager::on_session_message(const SessionPtr &session,
                                        const std::string &text,
                                        bool is_binary) {
  if (is_binary || !message_dispatcher_->Dispatch(session, text)) {
    session->send_text(protocol::replies::UNKNOWN_INPUT);
  }
}

void NetworkManager::on_session_closed(const SessionPtr &session,
                                       CloseReason reason) {
  registry_.unregister(session->id());
  values_->release_tracker(session->id());
  LOG_NET_INFO("Session {} removed ({})", session->id(), CloseReasonName(reason));
}

void NetworkManager::broadcast_except(uint64_t exclude_id,
                                      const std::string &text) {
  for (const auto &session : registry_.snapshot()) {
    if (session->id() != exclude_id && session->is_live()) {
      session->send_text(text);
    }
  }
}

nlohmann::json NetworkManager::status() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
      util::GetSteadyTime() - started_at_);

  nlohmann::json j;
  j["version"] = GetVersionString();
  j["started"] = util::FormatTime(started_time_);
  j["uptime"] = uptime.count();
  j["sessions"] = registry_.size();
  const uint64_t tracker = values_->tracker_id();
  if (tracker != 0) {
    j["tracker"] = tracker;
  } else {
    j["tracker"] = nullptr;
  }
  nlohmann::json values = nlohmann::json::object();
  for (const auto &key : TrackedValues::Keys()) {
    values[key] = values_->get(key).value_or(0);
  }
  j["values"] = values;

  StatusProvider provider;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    provider = advertisement_status_;
  }
  j["advertisement"] = provider ? provider() : nlohmann::json(nullptr);
  return j;
}

void NetworkManager::set_advertisement_status_provider(StatusProvider provider) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  advertisement_status_ = std::move(provider);
}

void NetworkManager::set_idle_callback(IdleCallback callback) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  idle_callback_ = std::move(callback);
}

} // namespace network
} // namespace heartsock
