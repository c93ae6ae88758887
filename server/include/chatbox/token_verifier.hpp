/*
 * 설명: HS256 JWT를 검증해 사용자 ID/이름/역할 클레임을 추출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Authentication)
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace chatbox {

struct UserClaims {
  std::string user_id;
  std::string name;
  std::vector<std::string> roles;

  bool HasRole(const std::string& role) const;
  bool IsAdmin() const;
};

class TokenVerifier {
 public:
  // 약한 비밀키는 기동 실패로 처리한다(std::invalid_argument).
  explicit TokenVerifier(std::string secret);

  static bool ValidateSecret(const std::string& secret, std::string& error_message);

  std::optional<UserClaims> Verify(const std::string& token, std::string& error_code,
                                   std::string& error_message) const;

 private:
  std::string secret_;
};

}  // namespace chatbox
