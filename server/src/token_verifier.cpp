/*
 * 설명: jwt-cpp로 서명/만료를 검증하고 필수 클레임을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Authentication)
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#include "chatbox/token_verifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <nlohmann/json.hpp>

namespace chatbox {
namespace {
constexpr std::size_t kMinSecretLength = 32;
constexpr std::array<const char*, 11> kWeakSecretWords{"secret",  "test",    "test123", "password",
                                                       "admin",   "changeme", "default", "example",
                                                       "demo",    "12345",   "placeholder"};

bool Fail(std::string& error_code, std::string& error_message, const std::string& message) {
  error_code = "unauthorized";
  error_message = message;
  return false;
}
}  // namespace

bool UserClaims::HasRole(const std::string& role) const {
  return std::find(roles.begin(), roles.end(), role) != roles.end();
}

bool UserClaims::IsAdmin() const { return HasRole("admin") || HasRole("chat_admin"); }

TokenVerifier::TokenVerifier(std::string secret) : secret_(std::move(secret)) {
  std::string error_message;
  if (!ValidateSecret(secret_, error_message)) {
    throw std::invalid_argument(error_message);
  }
}

bool TokenVerifier::ValidateSecret(const std::string& secret, std::string& error_message) {
  if (secret.empty()) {
    error_message = "JWT_SECRET이 설정되지 않았습니다";
    return false;
  }
  if (secret.size() < kMinSecretLength) {
    error_message = "JWT_SECRET은 최소 32자 이상이어야 합니다";
    return false;
  }
  std::string lowered = secret;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
  for (const char* weak : kWeakSecretWords) {
    if (lowered.find(weak) != std::string::npos) {
      error_message = std::string("JWT_SECRET에 취약한 문자열이 포함되어 있습니다: ") + weak;
      return false;
    }
  }
  return true;
}

std::optional<UserClaims> TokenVerifier::Verify(const std::string& token, std::string& error_code,
                                                std::string& error_message) const {
  if (token.empty()) {
    Fail(error_code, error_message, "토큰이 비어 있습니다");
    return std::nullopt;
  }
  nlohmann::json payload;
  try {
    auto decoded = jwt::decode<jwt::traits::nlohmann_json>(token);
    jwt::verify<jwt::traits::nlohmann_json>().allow_algorithm(jwt::algorithm::hs256{secret_}).verify(decoded);
    payload = decoded.get_payload_json();
  } catch (const std::exception& ex) {
    Fail(error_code, error_message, std::string("토큰 검증 실패: ") + ex.what());
    return std::nullopt;
  }

  UserClaims claims;
  auto user_it = payload.find("user_id");
  if (user_it == payload.end() || !user_it->is_string() || user_it->get<std::string>().empty()) {
    Fail(error_code, error_message, "user_id 클레임이 없습니다");
    return std::nullopt;
  }
  claims.user_id = user_it->get<std::string>();

  auto name_it = payload.find("name");
  if (name_it != payload.end() && name_it->is_string()) {
    claims.name = name_it->get<std::string>();
  }
  if (claims.name.empty()) {
    claims.name = claims.user_id;
  }

  auto roles_it = payload.find("roles");
  if (roles_it == payload.end() || !roles_it->is_array()) {
    Fail(error_code, error_message, "roles 클레임은 문자열 배열이어야 합니다");
    return std::nullopt;
  }
  for (const auto& role : *roles_it) {
    if (!role.is_string()) {
      Fail(error_code, error_message, "roles 클레임에 문자열이 아닌 값이 있습니다");
      return std::nullopt;
    }
    claims.roles.push_back(role.get<std::string>());
  }
  return claims;
}

}  // namespace chatbox
