/*
 * 설명: REST 응답 엔벨로프와 공용 시각 포맷을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (HTTP surface)
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbox {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// RFC 3339 UTC (밀리초 포함)
std::string ToIsoString(std::chrono::system_clock::time_point tp);

}  // namespace chatbox
