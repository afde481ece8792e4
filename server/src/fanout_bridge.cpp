/*
 * 설명: 팬아웃 브리지 프레임 구성/해석과 로컬 재전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_bridge_test.cpp
 */
#include "chatrelay/fanout_bridge.hpp"

#include <nlohmann/json.hpp>

namespace chatrelay {

FanoutBridge::FanoutBridge(std::string server_id, std::string channel_prefix,
                           std::shared_ptr<PubSubTransport> transport, std::shared_ptr<Dispatcher> dispatcher,
                           std::shared_ptr<Observability> observability)
    : server_id_(std::move(server_id)),
      channel_prefix_(std::move(channel_prefix)),
      transport_(std::move(transport)),
      dispatcher_(std::move(dispatcher)),
      observability_(std::move(observability)) {}

std::string FanoutBridge::ChannelFor(const std::string& chatroom_id) const {
  return channel_prefix_ + "chatroom:" + chatroom_id;
}

void FanoutBridge::Publish(const std::string& chatroom_id, const Envelope& env,
                           const std::optional<std::string>& exclude_user_id) {
  nlohmann::json frame{{"origin", server_id_},
                       {"chatroom_id", chatroom_id},
                       {"exclude_user_id", exclude_user_id ? nlohmann::json(*exclude_user_id) : nlohmann::json(nullptr)},
                       {"envelope", ToWire(env)}};
  try {
    transport_->Publish(ChannelFor(chatroom_id), frame.dump());
    if (observability_) {
      observability_->Increment(Metric::kBridgePublished);
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Increment(Metric::kBridgeErrors);
      observability_->Warn("bridge_publish_failed",
                           {{"chatroomId", chatroom_id}, {"event", env.event}, {"reason", ex.what()}});
    }
  }
}

void FanoutBridge::Start() {
  std::weak_ptr<FanoutBridge> weak = weak_from_this();
  transport_->Start(channel_prefix_ + "chatroom:*", [weak](const std::string& channel, const std::string& payload) {
    if (auto self = weak.lock()) {
      self->HandleIncoming(channel, payload);
    }
  });
  if (observability_) {
    observability_->Info("bridge_started", {{"serverId", server_id_}, {"pattern", channel_prefix_ + "chatroom:*"}});
  }
}

void FanoutBridge::Stop() { transport_->Stop(); }

void FanoutBridge::HandleIncoming(const std::string& channel, const std::string& payload) {
  auto frame = nlohmann::json::parse(payload, nullptr, false);
  if (frame.is_discarded() || !frame.is_object() || !frame.contains("envelope") ||
      !frame["chatroom_id"].is_string()) {
    if (observability_) {
      observability_->Increment(Metric::kBridgeErrors);
      observability_->Warn("bridge_frame_invalid", {{"channel", channel}});
    }
    return;
  }
  auto origin_it = frame.find("origin");
  if (origin_it == frame.end() || !origin_it->is_string()) {
    if (observability_) {
      observability_->Increment(Metric::kBridgeErrors);
      observability_->Warn("bridge_frame_invalid", {{"channel", channel}, {"reason", "origin"}});
    }
    return;
  }
  if (origin_it->get_ref<const std::string&>() == server_id_) {
    return;
  }
  auto env = FromWire(frame["envelope"]);
  if (!env) {
    if (observability_) {
      observability_->Increment(Metric::kBridgeErrors);
      observability_->Warn("bridge_envelope_invalid", {{"channel", channel}});
    }
    return;
  }
  std::optional<std::string> exclude;
  auto exclude_it = frame.find("exclude_user_id");
  if (exclude_it != frame.end() && exclude_it->is_string()) {
    exclude = exclude_it->get<std::string>();
  }
  if (observability_) {
    observability_->Increment(Metric::kBridgeReceived);
  }
  // 로컬 전달만 한다. 다시 발행하지 않는다.
  dispatcher_->ToChatroom(frame["chatroom_id"].get<std::string>(), *env, exclude);
}

}  // namespace chatrelay
