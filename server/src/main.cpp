/*
 * 설명: 서버 진입점으로 환경설정을 로드/검증해 실행하고 SIGINT/SIGTERM에서 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (ServerApp)
 * 테스트: server/tests/unit/config_test.cpp
 */
#include <csignal>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "chatbox/app.hpp"

int main() {
  using namespace chatbox;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "설정을 읽지 못했습니다: " << ex.what() << "\n";
    return 1;
  }
  std::string config_error;
  if (!ValidateConfig(config, config_error)) {
    std::cerr << "설정 오류: " << config_error << "\n";
    return 1;
  }

  try {
    ServerApp app(config);
    app.Start();

    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        std::cout << "신호 " << signal_number << " 수신, 종료를 준비합니다\n";
      }
    });
    signal_ioc.run();

    auto report = app.Stop();
    return report.deadline_exceeded ? 1 : 0;
  } catch (const std::exception& ex) {
    std::cerr << "서버 기동 실패: " << ex.what() << "\n";
    return 1;
  }
}
