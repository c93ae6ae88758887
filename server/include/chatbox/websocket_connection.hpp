/*
 * 설명: Beast WebSocket 위의 ClientConnection 구현. 송신 큐 백프레셔, 쓰기 기한, 연결별 순차 디스패치를 맡는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Connection Manager)
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chatbox/client_connection.hpp"
#include "chatbox/message_router.hpp"
#include "chatbox/observability.hpp"

namespace chatbox {

struct WebSocketLimits {
  std::size_t max_message_size{1048576};
  std::size_t queue_messages{64};
  std::size_t queue_bytes{1048576};
  std::chrono::milliseconds write_timeout{std::chrono::seconds(10)};
};

class WebSocketConnection : public ClientConnection, public std::enable_shared_from_this<WebSocketConnection> {
 public:
  using ClosedHandler = std::function<void(const std::shared_ptr<WebSocketConnection>&)>;

  WebSocketConnection(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string id, UserClaims user,
                      WebSocketLimits limits, std::shared_ptr<MessageRouter> router,
                      boost::asio::thread_pool& dispatch_pool, std::shared_ptr<Observability> observability,
                      ClosedHandler on_closed);

  // 업그레이드가 끝난 뒤 읽기 루프를 시작한다.
  void Run();

  bool Send(const std::string& frame) override;
  void Close(CloseReason reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueFrame(std::string frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void OnWriteTimeout(boost::beast::error_code ec, std::uint64_t write_id);
  void StartClose(CloseReason reason);
  void Finish();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  WebSocketLimits limits_;
  std::shared_ptr<MessageRouter> router_;
  boost::asio::strand<boost::asio::thread_pool::executor_type> dispatch_strand_;
  std::shared_ptr<Observability> observability_;
  ClosedHandler on_closed_;
  boost::asio::steady_timer write_timer_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  std::uint64_t write_id_{0};
  bool writing_{false};
  bool closing_{false};
  bool finished_{false};
};

}  // namespace chatbox
