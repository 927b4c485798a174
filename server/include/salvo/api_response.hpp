/*
 * 설명: 운영 HTTP 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace salvo {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail은 오류 원인을 보충하는 선택 필드이며 기본값은 null이다.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

}  // namespace salvo
