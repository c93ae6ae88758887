/*
 * 설명: WebSocket 프레임 읽기/디코딩, 송신 큐, 종료 코드별 닫기 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Connection Manager)
 * 테스트: server/tests/e2e/chat_flow_test.cpp
 */
#include "chatbox/websocket_connection.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace chatbox {
namespace {
boost::beast::websocket::close_reason ToCloseReason(CloseReason reason) {
  using boost::beast::websocket::close_code;
  boost::beast::websocket::close_reason close{close_code::normal};
  switch (reason) {
    case CloseReason::kNormal:
      break;
    case CloseReason::kShutdown:
      close.code = close_code::going_away;
      close.reason = "server_shutdown";
      break;
    case CloseReason::kMessageTooBig:
      close.code = close_code::too_big;
      close.reason = "message_too_big";
      break;
    case CloseReason::kBackpressure:
      close.code = close_code::policy_error;
      close.reason = "backpressure_exceeded";
      break;
    case CloseReason::kWriteTimeout:
      close.code = close_code::policy_error;
      close.reason = "write_timeout";
      break;
  }
  return close;
}

std::string_view CloseReasonName(CloseReason reason) {
  switch (reason) {
    case CloseReason::kNormal:
      return "normal";
    case CloseReason::kShutdown:
      return "server_shutdown";
    case CloseReason::kMessageTooBig:
      return "message_too_big";
    case CloseReason::kBackpressure:
      return "backpressure_exceeded";
    case CloseReason::kWriteTimeout:
      return "write_timeout";
  }
  return "unknown";
}
}  // namespace

WebSocketConnection::WebSocketConnection(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string id,
                                         UserClaims user, WebSocketLimits limits,
                                         std::shared_ptr<MessageRouter> router,
                                         boost::asio::thread_pool& dispatch_pool,
                                         std::shared_ptr<Observability> observability, ClosedHandler on_closed)
    : ClientConnection(std::move(id), std::move(user)), ws_(std::move(ws)), limits_(limits),
      router_(std::move(router)), dispatch_strand_(boost::asio::make_strand(dispatch_pool.get_executor())),
      observability_(std::move(observability)), on_closed_(std::move(on_closed)), write_timer_(ws_.get_executor()) {
  ws_.read_message_max(limits_.max_message_size);
  SetState(ConnectionState::kAuthenticated);
}

void WebSocketConnection::Run() {
  SetState(ConnectionState::kActive);
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self]() { self->DoRead(); });
}

void WebSocketConnection::DoRead() {
  if (finished_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketConnection::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::message_too_big) {
    // Beast가 1009로 닫기 프레임을 이미 보냈다.
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "message_too_big",
                          {{"connectionId", Id()}, {"userId", UserId()}, {"limit", limits_.max_message_size}});
    }
    return Finish();
  }
  if (ec) {
    if (ec != boost::beast::websocket::error::closed && observability_ && !closing_) {
      observability_->Log(LogLevel::kDebug, "websocket_read_failed",
                          {{"connectionId", Id()}, {"error", ec.message()}});
    }
    return Finish();
  }
  if (closing_) {
    buffer_.consume(buffer_.size());
    return DoRead();
  }

  Touch();
  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto self = shared_from_this();
  std::string error_code;
  std::string error_message;
  auto message = DecodeMessage(data, error_code, error_message);
  if (!message) {
    boost::asio::post(dispatch_strand_, [self, error_code, error_message]() {
      self->router_->RejectFrame(self, error_code, error_message);
    });
  } else {
    boost::asio::post(dispatch_strand_, [self, message = std::move(*message)]() mutable {
      if (self->State() == ConnectionState::kActive) {
        self->router_->Dispatch(std::move(message), self);
      }
    });
  }
  DoRead();
}

bool WebSocketConnection::Send(const std::string& frame) {
  if (State() != ConnectionState::kActive) {
    return false;
  }
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, frame]() { self->EnqueueFrame(frame); });
  return true;
}

void WebSocketConnection::EnqueueFrame(std::string frame) {
  if (closing_) {
    return;
  }
  const auto frame_size = frame.size();
  if (send_queue_.size() >= limits_.queue_messages || queued_bytes_ + frame_size > limits_.queue_bytes) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "backpressure_close",
                          {{"connectionId", Id()}, {"queued", send_queue_.size()}, {"queuedBytes", queued_bytes_}});
    }
    return StartClose(CloseReason::kBackpressure);
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += frame_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketConnection::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  auto write_id = ++write_id_;
  write_timer_.expires_after(limits_.write_timeout);
  write_timer_.async_wait([self, write_id](boost::beast::error_code ec) { self->OnWriteTimeout(ec, write_id); });
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketConnection::OnWrite(boost::beast::error_code ec) {
  write_timer_.cancel();
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    SetState(ConnectionState::kClosing);
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketConnection::OnWriteTimeout(boost::beast::error_code ec, std::uint64_t write_id) {
  if (ec || !writing_ || write_id != write_id_) {
    return;
  }
  if (observability_) {
    observability_->Log(LogLevel::kWarn, "write_timeout", {{"connectionId", Id()}, {"userId", UserId()}});
  }
  closing_ = true;
  SetState(ConnectionState::kClosing);
  send_queue_.clear();
  queued_bytes_ = 0;
  // 쓰기가 멈춘 소켓에는 닫기 프레임을 보낼 수 없으므로 TCP를 바로 닫는다.
  boost::beast::get_lowest_layer(ws_).close();
}

void WebSocketConnection::Close(CloseReason reason) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, reason]() { self->StartClose(reason); });
}

void WebSocketConnection::StartClose(CloseReason reason) {
  if (closing_ || finished_) {
    return;
  }
  closing_ = true;
  SetState(ConnectionState::kClosing);
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "websocket_closing",
                        {{"connectionId", Id()}, {"reason", std::string(CloseReasonName(reason))}});
  }
  if (reason == CloseReason::kWriteTimeout) {
    boost::beast::get_lowest_layer(ws_).close();
    return;
  }
  auto self = shared_from_this();
  ws_.async_close(ToCloseReason(reason), [self](boost::beast::error_code ec) {
    if (ec) {
      boost::beast::get_lowest_layer(self->ws_).close();
    }
    self->Finish();
  });
}

void WebSocketConnection::Finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  closing_ = true;
  write_timer_.cancel();
  SetState(ConnectionState::kClosed);
  if (on_closed_) {
    on_closed_(shared_from_this());
  }
}

}  // namespace chatbox
